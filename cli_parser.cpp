#include "cli_parser.hpp"

namespace filepix {

    static bool isOption(const std::string& arg)
    {
        return arg.size() >= 2 && arg[0] == '-' && arg[1] == '-';
    }

    bool CliParser::setOption(const std::string& key, const std::string& value)
    {
        if (key.empty()) {
            error_ = "option name missing after \"--\"";
            return false;
        }
        if (!options_.emplace(key, value).second) {
            error_ = "option --" + key + " given more than once";
            return false;
        }
        return true;
    }

    bool CliParser::parse(int argc, char** argv)
    {
        command_.clear();
        error_.clear();
        help_ = false;
        options_.clear();

        int i = 1;
        while (i < argc) {
            const std::string arg = argv[i] ? argv[i] : "";
            ++i;

            if (arg == "-h" || arg == "--help") {
                help_ = true;
                continue;
            }

            if (!isOption(arg)) {
                if (!command_.empty()) {
                    error_ = "unexpected argument: " + arg;
                    return false;
                }
                command_ = arg;
                continue;
            }

            const std::string body = arg.substr(2);
            const size_t eq = body.find('=');
            if (eq != std::string::npos) {
                if (!setOption(body.substr(0, eq), body.substr(eq + 1))) return false;
                continue;
            }

            // --key value, 下一个也是 option 时当作 flag
            std::string value = "true";
            if (i < argc && argv[i] && !isOption(argv[i])) {
                value = argv[i];
                ++i;
            }
            if (!setOption(body, value)) return false;
        }
        return true;
    }

    bool CliParser::has(const std::string& key) const
    {
        return options_.count(key) != 0;
    }

    std::string CliParser::get(const std::string& key, const std::string& def) const
    {
        const auto it = options_.find(key);
        return it == options_.end() ? def : it->second;
    }

}
