#include <devledger/common/error.hpp>
#include <devledger/ledger/composite_key.hpp>

#include <cstdint>

namespace devledger::ledger::composite {

    namespace {

        // Decodes one UTF-8 sequence starting at `pos`; returns 0 on malformed input
        size_t decodeRune(const std::string &s, size_t pos, uint32_t &rune) {
            auto byte = [&](size_t i) { return static_cast<uint8_t>(s[i]); };
            uint8_t lead = byte(pos);

            if (lead < 0x80) {
                rune = lead;
                return 1;
            }

            size_t len = 0;
            uint32_t min = 0;
            if ((lead & 0xE0) == 0xC0) {
                len = 2;
                rune = lead & 0x1F;
                min = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3;
                rune = lead & 0x0F;
                min = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4;
                rune = lead & 0x07;
                min = 0x10000;
            } else {
                return 0;
            }

            if (pos + len > s.size())
                return 0;

            for (size_t i = 1; i < len; ++i) {
                uint8_t cont = byte(pos + i);
                if ((cont & 0xC0) != 0x80)
                    return 0;
                rune = (rune << 6) | (cont & 0x3F);
            }

            // Overlong forms, surrogates and out-of-range code points
            if (rune < min || rune > 0x10FFFF || (rune >= 0xD800 && rune <= 0xDFFF))
                return 0;

            return len;
        }

        dp::Result<std::string, dp::Error> build(const std::string &category, const std::vector<std::string> &attributes) {
            auto check = validateAttribute(category);
            if (check.is_err()) {
                return dp::Result<std::string, dp::Error>::err(withContext(check.error(), "category"));
            }

            std::string key(1, NAMESPACE);
            key += category;
            key += NAMESPACE;

            for (const auto &attribute : attributes) {
                check = validateAttribute(attribute);
                if (check.is_err()) {
                    return dp::Result<std::string, dp::Error>::err(withContext(check.error(), "attribute"));
                }
                key += attribute;
                key += NAMESPACE;
            }

            return dp::Result<std::string, dp::Error>::ok(std::move(key));
        }

    } // namespace

    dp::Result<void, dp::Error> validateAttribute(const std::string &value) {
        size_t pos = 0;
        while (pos < value.size()) {
            uint32_t rune = 0;
            size_t len = decodeRune(value, pos, rune);
            if (len == 0) {
                return dp::Result<void, dp::Error>::err(
                    invalid_key("not a valid utf8 string at byte " + std::to_string(pos)));
            }
            if (rune == 0x0000 || rune == 0x10FFFF) {
                return dp::Result<void, dp::Error>::err(
                    invalid_key("contains reserved code point at byte " + std::to_string(pos)));
            }
            pos += len;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::string, dp::Error> create(const std::string &category, const std::vector<std::string> &attributes) {
        if (category.empty()) {
            return dp::Result<std::string, dp::Error>::err(invalid_key("composite key category is empty"));
        }
        return build(category, attributes);
    }

    dp::Result<std::string, dp::Error> createPartial(const std::string &category,
                                                     const std::vector<std::string> &attributes) {
        if (category.empty()) {
            return dp::Result<std::string, dp::Error>::err(invalid_key("composite key category is empty"));
        }
        return build(category, attributes);
    }

    std::string rangeEnd(const std::string &partial_key) { return partial_key + MAX_UNICODE_RUNE; }

    dp::Result<std::pair<std::string, std::vector<std::string>>, dp::Error> split(const std::string &key) {
        using SplitResult = dp::Result<std::pair<std::string, std::vector<std::string>>, dp::Error>;

        if (!isComposite(key) || key.back() != NAMESPACE || key.size() < 3) {
            return SplitResult::err(invalid_key("not a composite key"));
        }

        std::vector<std::string> parts;
        size_t start = 1;
        for (size_t i = 1; i < key.size(); ++i) {
            if (key[i] == NAMESPACE) {
                parts.push_back(key.substr(start, i - start));
                start = i + 1;
            }
        }

        std::string category = parts.front();
        if (category.empty()) {
            return SplitResult::err(invalid_key("composite key category is empty"));
        }
        parts.erase(parts.begin());
        return SplitResult::ok({std::move(category), std::move(parts)});
    }

    std::string toDisplay(const std::string &key) {
        std::string out;
        out.reserve(key.size());
        for (char c : key) {
            out += (c == NAMESPACE) ? '/' : c;
        }
        return out;
    }

} // namespace devledger::ledger::composite
