#include "tfgen/flag_set.hpp"

#include "log/log.hpp"

namespace wheels::tfgen {

FlagSet::FlagSet(std::string name) : name_(std::move(name)) {}

void FlagSet::define(std::string name, std::string default_value, std::string usage) {
    Flag flag;
    flag.name = name;
    flag.usage = std::move(usage);
    flag.default_value = std::move(default_value);
    flags_[std::move(name)] = std::move(flag);
}

void FlagSet::define_bool(std::string name, std::string usage) {
    Flag flag;
    flag.name = name;
    flag.usage = std::move(usage);
    flag.default_value = "false";
    flag.is_bool = true;
    flags_[std::move(name)] = std::move(flag);
}

auto FlagSet::lookup(std::string_view name) const -> const Flag* {
    auto it = flags_.find(name);
    return it == flags_.end() ? nullptr : &it->second;
}

auto FlagSet::value(std::string_view name) const -> std::string {
    for (auto it = occurrences_.rbegin(); it != occurrences_.rend(); ++it) {
        if (it->name == name) {
            return it->value;
        }
    }
    const Flag* flag = lookup(name);
    return flag ? flag->default_value : "";
}

auto FlagSet::is_set(std::string_view name) const -> bool {
    for (const auto& occ : occurrences_) {
        if (occ.name == name) {
            return true;
        }
    }
    return false;
}

void FlagSet::visit_all(const std::function<void(const Flag&)>& fn) const {
    for (const auto& [_, flag] : flags_) {
        fn(flag);
    }
}

auto FlagSet::set(const std::string& name, const std::string& value) -> Result<bool> {
    if (!lookup(name)) {
        return Error("flag provided but not defined: -" + name);
    }
    occurrences_.push_back({name, value});
    return true;
}

auto FlagSet::parse(const std::vector<std::string>& args) -> Result<bool> {
    occurrences_.clear();
    args_.clear();

    size_t i = 0;
    while (i < args.size()) {
        const std::string& arg = args[i];

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        size_t dashes = arg[1] == '-' ? 2 : 1;
        std::string body = arg.substr(dashes);
        if (body.empty() || body[0] == '-' || body[0] == '=') {
            return Error("bad flag syntax: " + arg);
        }

        std::string name = body;
        std::string value;
        bool has_value = false;
        size_t eq = body.find('=');
        if (eq != std::string::npos) {
            name = body.substr(0, eq);
            value = body.substr(eq + 1);
            has_value = true;
        }

        const Flag* flag = lookup(name);
        if (!flag) {
            return Error("flag provided but not defined: -" + name);
        }

        if (flag->is_bool) {
            if (!has_value) {
                value = "true";
            } else if (value == "1" || value == "true") {
                value = "true";
            } else if (value == "0" || value == "false") {
                value = "false";
            } else {
                return Error("invalid boolean value \"" + value + "\" for -" + name);
            }
        } else if (!has_value) {
            if (i + 1 >= args.size()) {
                return Error("flag needs an argument: -" + name);
            }
            value = args[++i];
        }

        WHEELS_LOG_TRACE("tfgen", name_ << ": -" << name << "=" << value);
        occurrences_.push_back({name, value});
        ++i;
    }

    for (; i < args.size(); ++i) {
        args_.push_back(args[i]);
    }
    return true;
}

} // namespace wheels::tfgen
