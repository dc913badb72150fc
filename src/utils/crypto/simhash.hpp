#pragma once
#include <stdint.h>
#include <string>
#include <vector>

namespace Burrow {
namespace Utils {
namespace Crypto {

/**
 * @brief 64-bit SimHash over the normalized words of a document.
 *
 * Near-identical pages produce fingerprints a small Hamming distance apart.
 */
class SimHash {
public:
    static uint64_t fingerprint(const std::string& text);

    static int distance(uint64_t a, uint64_t b);

    /// 1.0 for identical fingerprints, 0.0 when every bit differs.
    static double similarity(uint64_t a, uint64_t b);

    /// Lower-cased words with punctuation and stop-words removed.
    static std::vector<std::string> tokenize(const std::string& text);

    static uint64_t fnv1a(const std::string& token);
};

}  // namespace Crypto
}  // namespace Utils
}  // namespace Burrow
