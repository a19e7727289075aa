#include "sloup/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace sloup::cli {
    namespace {
        using sloup::core::Status;

        [[nodiscard]] Status bad_token(u32 index) noexcept {
            return sloup::core::make_status(sloup::core::StatusDomain::Cli, sloup::core::StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return true;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
                case OptionType::Flag:
                    return false;
            }
            return false;
        }

        [[nodiscard]] bool push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return false;
            }
            out->data[out->len++] = opt;
            return true;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return bad_token(0);
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return bad_token(0);
        }
        if (spec_count > 0 && specs == nullptr) {
            return bad_token(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const u32 at = i;
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return bad_token(at);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            ++i;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return bad_token(at);
                }
                opt.value.boolv = 1;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return bad_token(at);
                    }
                    value = args.argv[i++];
                }
                if (!set_value(*spec, value, &opt)) {
                    return bad_token(at);
                }
            }

            if (!push_option(out, opt)) {
                return bad_token(at);
            }
        }

        *consumed = i;
        return sloup::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    bool has_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* o = find_option(opts, id);
        return o != nullptr && o->type == OptionType::Flag && o->value.boolv != 0;
    }
} // namespace sloup::cli
