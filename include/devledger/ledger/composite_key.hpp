#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <utility>
#include <vector>

namespace devledger::ledger {

    /// Composite key layout:
    ///   0x00 <category> 0x00 <attr_1> 0x00 ... <attr_n> 0x00
    /// Category and attributes must be valid UTF-8 without U+0000 or U+10FFFF.
    /// Under that restriction distinct (category, attributes) tuples never share a key.
    namespace composite {

        /// Leading byte of every composite key and separator between its parts
        constexpr char NAMESPACE = '\x00';

        /// UTF-8 encoding of U+10FFFF, the upper bound of a partial key range
        inline const std::string MAX_UNICODE_RUNE = "\xF4\x8F\xBF\xBF";

        /// Check that a category or attribute can be embedded in a composite key
        dp::Result<void, dp::Error> validateAttribute(const std::string &value);

        /// Build the key addressing (category, attributes)
        dp::Result<std::string, dp::Error> create(const std::string &category, const std::vector<std::string> &attributes);

        /// Build the key prefix shared by every key of `category` starting with `attributes`
        dp::Result<std::string, dp::Error> createPartial(const std::string &category,
                                                         const std::vector<std::string> &attributes);

        /// Exclusive upper bound for a range scan over keys extending `partial_key`
        std::string rangeEnd(const std::string &partial_key);

        /// Decompose a composite key back into (category, attributes)
        dp::Result<std::pair<std::string, std::vector<std::string>>, dp::Error> split(const std::string &key);

        /// True if `key` lives in the composite key namespace
        inline bool isComposite(const std::string &key) { return !key.empty() && key.front() == NAMESPACE; }

        /// Printable form of a key, with separators shown as '/'
        std::string toDisplay(const std::string &key);

    } // namespace composite

} // namespace devledger::ledger
