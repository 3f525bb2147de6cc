#pragma once

#include "reglink/Result.hpp"
#include "reglink/snapshot/Snapshot.hpp"

#include <atomic>
#include <string>

namespace reglink
{
    /**
     * Shared snapshot file. Several processes save and load it on their own
     * timers without any lock: every save lands through a rename of a private
     * temporary file, so a reader sees either the old or the new version.
     * Loads carry no ordering guarantee and may be stale.
     */
    class SnapshotStore
    {
      public:
        explicit SnapshotStore(std::string path);

        auto save(const Snapshot& snapshot) -> Result<void>;
        auto save(const RegisterBank& bank, const Projection& projection) -> Result<void>;

        // NotFound while no process has created the file yet; callers retry next cycle
        auto load() const -> Result<Snapshot>;

        auto exists() const -> bool;

        /**
         * Creates the file when it is missing, from the seed file if it can be
         * read, otherwise from the given defaults. An existing file is kept.
         */
        auto seed(const std::string& seedPath, const Snapshot& defaults) -> Result<void>;

        inline auto path() const -> const std::string& { return m_path; }

      private:
        auto tempPath() -> std::string;

        std::string m_path;
        std::atomic<uint64_t> m_sequence{ 0 };
    };

    auto encodeSnapshot(const Snapshot& snapshot) -> std::string;
    auto decodeSnapshot(std::string_view text) -> Result<Snapshot>;
} // namespace reglink
