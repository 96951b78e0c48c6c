#include <tagged/json/json.hpp>

namespace tagged {
std::string_view json_kind(dj::Json const& json) {
	if (json.is_bool()) { return "boolean"; }
	if (json.is_number()) { return "number"; }
	if (json.is_string()) { return "string"; }
	if (json.is_array()) { return "array"; }
	if (json.is_object()) { return "object"; }
	return "null";
}
} // namespace tagged
