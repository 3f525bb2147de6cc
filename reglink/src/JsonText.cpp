#include "reglink/snapshot/JsonText.hpp"
#include "reglink/log/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace reglink
{
    auto stripComments(std::string_view text) -> std::string
    {
        std::string out;
        out.reserve(text.size());

        while (!text.empty()) {
            auto eol{ text.find('\n') };
            auto line{ text.substr(0, eol) };
            text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

            auto first{ line.find_first_not_of(" \t\r") };
            if (first != std::string_view::npos && line[first] == '#') {
                continue;
            }
            if (auto hash{ line.find('#') }; hash != std::string_view::npos) {
                line = line.substr(0, hash);
            }
            out.append(line);
            out.push_back('\n');
        }
        return out;
    }

    auto parseJson(std::string_view text) -> Result<Json::Value>
    {
        auto clean{ stripComments(text) };

        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader{ builder.newCharReader() };

        Json::Value root;
        std::string errors;
        if (!reader->parse(clean.data(), clean.data() + clean.size(), &root, &errors)) {
            log::debug("json parse failed: {}", errors);
            return fail(Errc::ParseError);
        }
        return root;
    }

    auto readJsonFile(const std::string& path) -> Result<Json::Value>
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return fail(Errc::NotFound);
        }

        std::ifstream file(path);
        if (!file) {
            return fail(Errc::IOError);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return fail(Errc::IOError);
        }
        return parseJson(buffer.str());
    }
} // namespace reglink
