#include "capture/Fingerprint.hpp"
#include "text/TextUtil.hpp"

namespace capture {

int32_t rolling_hash_value(const std::string& s) {
    // unsigned arithmetic gives the wrap-around without signed overflow
    uint32_t h = 0;
    for (unsigned char c : s) {
        h = h * 31u + static_cast<uint32_t>(c);
    }
    return static_cast<int32_t>(h);
}

std::string rolling_hash(const std::string& s) {
    const int64_t v = rolling_hash_value(s);
    uint64_t mag = static_cast<uint64_t>(v < 0 ? -v : v);

    if (mag == 0) return "0";

    const char* hex = "0123456789abcdef";
    std::string out;
    while (mag > 0) {
        out.insert(out.begin(), hex[mag & 0xF]);
        mag >>= 4;
    }
    if (v < 0) out.insert(out.begin(), '-');
    return out;
}

std::string fingerprint(const std::string& content) {
    std::string head = textutil::utf8_prefix(content, kFingerprintPrefix);
    return rolling_hash(textutil::trim_copy(textutil::to_lower_copy(head)));
}

std::string snapshot_digest(const std::vector<Fragment>& fragments) {
    std::string joined;
    for (size_t i = 0; i < fragments.size(); ++i) {
        if (i > 0) joined += "|||";
        joined += fragments[i].text;
    }
    return rolling_hash(joined);
}

}  // namespace capture
