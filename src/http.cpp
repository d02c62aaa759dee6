#include <firestore-cpp/http.hpp>

namespace firestore_cpp {

auto url_encode(std::string_view s) -> std::string {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    auto out = std::string{};
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex_chars[c >> 4]);
            out.push_back(hex_chars[c & 0x0F]);
        }
    }
    return out;
}

}  // namespace firestore_cpp
