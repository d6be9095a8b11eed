#pragma once
#include <string>
#include <vector>

namespace capture {

enum class Role {
    User,
    Assistant
};

const char* role_str(Role r);

// "user" / "assistant" -> Role; false for anything else
bool parse_role(const std::string& s, Role& out);

struct Fragment {
    Role role = Role::User;
    std::string text;
    double position = 0.0;           // vertical screen coordinate, ordering only
};

struct Message {
    Role role = Role::User;
    std::string content;             // non-empty after normalization
};

inline bool operator==(const Message& a, const Message& b) {
    return a.role == b.role && a.content == b.content;
}

inline bool operator!=(const Message& a, const Message& b) {
    return !(a == b);
}

struct ConversationSnapshot {
    std::vector<Message> messages;
    std::string digest;              // whole-snapshot rolling hash
};

}  // namespace capture
