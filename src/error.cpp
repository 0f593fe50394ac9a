#include "richenum/error.hpp"


namespace richenum {

std::string_view to_string(error_code code) noexcept {
    switch (code) {
        case error_code::duplicate_value:       return "duplicate_value";
        case error_code::duplicate_index:       return "duplicate_index";
        case error_code::exhausted_value_space: return "exhausted_value_space";
        case error_code::exhausted_index_space: return "exhausted_index_space";
        case error_code::not_found:             return "not_found";
        case error_code::invalid_argument:      return "invalid_argument";
        case error_code::default_already_set:   return "default_already_set";
        case error_code::invalid_json:          return "invalid_json";
        case error_code::io_failure:            return "io_failure";
    }
    return "unknown";
}

} // namespace richenum
