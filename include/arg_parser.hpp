#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line tokenizer for the wtenv front end.
 *
 * Understands `--opt value`, `--opt=value`, short aliases (`-r value`,
 * `-rvalue`, `-r=value`) and clusters of short switches (`-fy`). Everything
 * after `--` is positional. Names missing from the known set are collected
 * in unknown_flags() instead of being stored.
 *
 * Names listed as switches are booleans and never take the next argument,
 * so `wtenv delete --force demo` keeps `demo` positional. Every value of a
 * repeated option is kept for get_all_options().
 */
class ArgParser {
  public:
    /**
     * @param argc,argv   Arguments as passed to `main`.
     * @param known_flags Accepted long names; empty accepts everything.
     * @param short_map   Single letter aliases, e.g. `'r' -> "--repo"`.
     * @param switches    Long names that never consume a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {})
        : known_(known_flags), aliases_(short_map), switches_(switches) {
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + (argc > 0 ? argc : 0));
        size_t i = 0;
        while (i < args.size()) {
            const std::string& arg = args[i++];
            if (arg == "--") {
                positional_.insert(positional_.end(), args.begin() + i, args.end());
                break;
            }
            if (arg.rfind("--", 0) == 0)
                parse_long(arg, args, i);
            else if (arg.size() > 1 && arg[0] == '-')
                parse_short(arg, args, i);
            else
                positional_.push_back(arg);
        }
    }

    /** @brief Whether @p flag (with leading dashes) appeared, with or without a value. */
    bool has_flag(const std::string& flag) const { return seen_.count(flag) > 0; }

    /** @brief Last value given for @p opt, or an empty string. */
    std::string get_option(const std::string& opt) const {
        auto it = values_.find(opt);
        return it == values_.end() ? std::string() : it->second.back();
    }

    /** @brief Whether @p opt was given together with a value. */
    bool has_value(const std::string& opt) const { return values_.count(opt) > 0; }

    /** @brief Every value given for @p opt, in command line order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = values_.find(opt);
        return it == values_.end() ? std::vector<std::string>() : it->second;
    }

    const std::set<std::string>& flags() const { return seen_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_; }

  private:
    bool accept(const std::string& name) {
        if (!known_.empty() && known_.count(name) == 0) {
            unknown_.push_back(name);
            return false;
        }
        seen_.insert(name);
        return true;
    }

    void add_value(const std::string& name, const std::string& value) {
        if (accept(name))
            values_[name].push_back(value);
    }

    static bool looks_like_value(const std::vector<std::string>& args, size_t i) {
        return i < args.size() && args[i].rfind("-", 0) != 0;
    }

    void parse_long(const std::string& arg, const std::vector<std::string>& args, size_t& i) {
        auto eq = arg.find('=');
        if (eq != std::string::npos)
            add_value(arg.substr(0, eq), arg.substr(eq + 1));
        else if (switches_.count(arg) == 0 && looks_like_value(args, i))
            add_value(arg, args[i++]);
        else
            accept(arg);
    }

    // `-fy` sets two switches; `-rapi:main` and `-r=api:main` give -r a value.
    void parse_short(const std::string& arg, const std::vector<std::string>& args, size_t& i) {
        auto eq = arg.find('=');
        const std::string letters = arg.substr(1, eq == std::string::npos ? std::string::npos : eq - 1);
        for (size_t pos = 0; pos < letters.size(); ++pos) {
            auto alias = aliases_.find(letters[pos]);
            if (alias == aliases_.end()) {
                unknown_.push_back(std::string("-") + letters[pos]);
                return;
            }
            const std::string& name = alias->second;
            if (switches_.count(name)) {
                accept(name);
                continue;
            }
            if (pos + 1 < letters.size())
                add_value(name, letters.substr(pos + 1));
            else if (eq != std::string::npos)
                add_value(name, arg.substr(eq + 1));
            else if (looks_like_value(args, i))
                add_value(name, args[i++]);
            else
                accept(name);
            return;
        }
    }

    std::set<std::string> known_;
    std::map<char, std::string> aliases_;
    std::set<std::string> switches_;
    std::set<std::string> seen_;
    std::map<std::string, std::vector<std::string>> values_;
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_;
};

#endif // ARG_PARSER_HPP
