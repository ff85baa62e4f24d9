#ifndef CLI_PARSER_HPP
#define CLI_PARSER_HPP

#include <string>
#include <map>

namespace filepix {

    // filepix <command> [--key value | --key=value | --flag]...
    //
    // parse() 返回 false 时 error() 说明原因:
    //   - 多出来的位置参数
    //   - 同一个 option 出现两次
    //   - "--" 后面没有名字
    // 没有值的 --flag 记为 "true"; -h / --help 只置 helpRequested()
    class CliParser {
    public:
        bool parse(int argc, char** argv);

        const std::string& command() const { return command_; }
        const std::string& error() const { return error_; }
        bool helpRequested() const { return help_; }

        bool has(const std::string& key) const;
        std::string get(const std::string& key, const std::string& def = "") const;

    private:
        bool setOption(const std::string& key, const std::string& value);

        std::string command_;
        std::string error_;
        bool help_ = false;
        std::map<std::string, std::string> options_;
    };

}

#endif // CLI_PARSER_HPP
