#include "capture/Models.hpp"

namespace capture {

const char* role_str(Role r) {
    switch (r) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        default: return "unknown";
    }
}

bool parse_role(const std::string& s, Role& out) {
    if (s == "user") {
        out = Role::User;
        return true;
    }
    if (s == "assistant") {
        out = Role::Assistant;
        return true;
    }
    return false;
}

}  // namespace capture
