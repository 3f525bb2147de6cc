#include "reglink/Result.hpp"

#include <magic_enum/magic_enum.hpp>

#include <string>

namespace
{
    class ReglinkCategory : public std::error_category
    {
      public:
        const char* name() const noexcept override { return "reglink"; }

        std::string message(int ev) const override
        {
            auto name{ magic_enum::enum_name(static_cast<reglink::Errc>(ev)) };
            return name.empty() ? std::string("Unknown") : std::string(name);
        }
    };
}

namespace reglink
{
    auto reglink_category() noexcept -> const std::error_category&
    {
        static ReglinkCategory instance;
        return instance;
    }

    auto make_error_code(Errc e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(e), reglink_category());
    }
} // namespace reglink
