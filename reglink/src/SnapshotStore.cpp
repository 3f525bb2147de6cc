#include "reglink/snapshot/SnapshotStore.hpp"
#include "reglink/log/Logger.hpp"
#include "reglink/snapshot/JsonText.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

namespace reglink
{
    namespace
    {
        auto parseAddress(const std::string& key) -> std::optional<uint16_t>
        {
            uint16_t address{};
            auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), address);
            if (ec != std::errc() || ptr != key.data() + key.size()) {
                return std::nullopt;
            }
            return address;
        }

        auto parseValue(const Json::Value& value) -> std::optional<uint16_t>
        {
            if (value.isBool()) {
                return value.asBool() ? 1 : 0;
            }
            if (value.isInt64()) {
                return clampRegister(value.asInt64());
            }
            if (value.isUInt64()) {
                return clampRegister(value.asUInt64());
            }
            if (value.isDouble()) {
                return clampRegister(value.asDouble());
            }
            return std::nullopt;
        }

        // the data reaches the disk before the file can be renamed into place
        auto writeDurably(const std::string& path, std::string_view text) -> Result<void>
        {
            const int fd{ ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644) };
            if (fd < 0) {
                return fail(Errc::IOError);
            }

            auto failed{ false };
            while (!text.empty()) {
                const auto written{ ::write(fd, text.data(), text.size()) };
                if (written < 0 && errno == EINTR) {
                    continue;
                }
                if (written <= 0) {
                    failed = true;
                    break;
                }
                text.remove_prefix(static_cast<size_t>(written));
            }
            failed = failed || ::fsync(fd) != 0;
            failed = ::close(fd) != 0 || failed;
            if (failed) {
                return fail(Errc::IOError);
            }
            return success();
        }
    }

    auto encodeSnapshot(const Snapshot& snapshot) -> std::string
    {
        Json::Value root(Json::objectValue);
        for (auto space : ALL_SPACES) {
            Json::Value entries(Json::objectValue);
            for (const auto& [address, value] : snapshot.values(space)) {
                entries[std::to_string(address)] = Json::UInt(value);
            }
            root[std::string(snapshotKey(space))] = std::move(entries);
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, root) + "\n";
    }

    auto decodeSnapshot(std::string_view text) -> Result<Snapshot>
    {
        auto root{ parseJson(text) };
        if (!root) {
            return std::unexpected(root.error());
        }
        if (!root->isObject()) {
            return fail(Errc::ParseError);
        }

        Snapshot snapshot;
        for (auto space : ALL_SPACES) {
            const auto& entries{ (*root)[std::string(snapshotKey(space))] };
            if (entries.isNull()) {
                continue;
            }
            if (!entries.isObject()) {
                log::debug("snapshot: '{}' is not an object, ignored", snapshotKey(space));
                continue;
            }

            for (const auto& key : entries.getMemberNames()) {
                auto address{ parseAddress(key) };
                auto value{ parseValue(entries[key]) };
                if (!address || !value) {
                    log::debug("snapshot: skipping {}[{}]", shortName(space), key);
                    continue;
                }
                snapshot.set(space, *address, *value);
            }
        }
        return snapshot;
    }

    SnapshotStore::SnapshotStore(std::string path)
      : m_path(std::move(path))
    {
    }

    auto SnapshotStore::tempPath() -> std::string
    {
        return std::format("{}.{}.{}.tmp", m_path, ::getpid(), m_sequence.fetch_add(1));
    }

    auto SnapshotStore::save(const Snapshot& snapshot) -> Result<void>
    {
        auto tmp{ tempPath() };
        if (auto res = writeDurably(tmp, encodeSnapshot(snapshot)); !res) {
            log::warning("snapshot: cannot write {}: {}", tmp, res.error().message());
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return res;
        }

        std::error_code ec;
        std::filesystem::rename(tmp, m_path, ec);
        if (ec) {
            log::warning("snapshot: rename {} -> {} failed: {}", tmp, m_path, ec.message());
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return fail(Errc::IOError);
        }
        return success();
    }

    auto SnapshotStore::save(const RegisterBank& bank, const Projection& projection) -> Result<void>
    {
        auto snapshot{ Snapshot::capture(bank, projection) };
        if (!snapshot) {
            return std::unexpected(snapshot.error());
        }
        return save(*snapshot);
    }

    auto SnapshotStore::load() const -> Result<Snapshot>
    {
        std::ifstream file(m_path);
        if (!file) {
            std::error_code ec;
            return fail(std::filesystem::exists(m_path, ec) ? Errc::IOError : Errc::NotFound);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return fail(Errc::IOError);
        }
        return decodeSnapshot(buffer.str());
    }

    auto SnapshotStore::exists() const -> bool
    {
        std::error_code ec;
        return std::filesystem::exists(m_path, ec);
    }

    auto SnapshotStore::seed(const std::string& seedPath, const Snapshot& defaults) -> Result<void>
    {
        if (exists()) {
            return success();
        }

        auto initial{ defaults };
        if (!seedPath.empty()) {
            std::ifstream file(seedPath);
            if (file) {
                std::stringstream buffer;
                buffer << file.rdbuf();
                if (auto seeded = decodeSnapshot(buffer.str()); seeded) {
                    initial = std::move(*seeded);
                    log::info("snapshot: seeding {} from {}", m_path, seedPath);
                }
                else {
                    log::warning("snapshot: seed file {} unreadable ({}), using defaults",
                                 seedPath,
                                 seeded.error().message());
                }
            }
            else {
                log::info("snapshot: no seed file {}, using defaults", seedPath);
            }
        }
        return save(initial);
    }
} // namespace reglink
