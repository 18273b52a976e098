#include <strata/core/account_id.hpp>

#include <string_view>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr bool is_alphanumeric(char const c)
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

constexpr bool is_separator(char const c)
{
    return c == '-' || c == '_' || c == '.';
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

bool is_valid_account_id(std::string_view const id)
{
    if (id.size() < min_account_id_length ||
        id.size() > max_account_id_length) {
        return false;
    }

    bool last_was_separator = true;
    for (char const c : id) {
        if (is_separator(c)) {
            if (last_was_separator) {
                return false;
            }
            last_was_separator = true;
        }
        else if (is_alphanumeric(c)) {
            last_was_separator = false;
        }
        else {
            return false;
        }
    }
    return !last_was_separator;
}

STRATA_NAMESPACE_END
