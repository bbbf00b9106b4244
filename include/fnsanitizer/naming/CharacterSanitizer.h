#ifndef FNSANITIZER_CHARACTER_SANITIZER_H
#define FNSANITIZER_CHARACTER_SANITIZER_H

#include "fnsanitizer/utils/RandomSource.h"
#include <string>
#include <utility>
#include <vector>

namespace fns {

/**
 * Character sets driving the sanitizer
 *
 * - badChars: illegal on common filesystems, replaced with '_'
 * - questionableChars: legal but troublesome in scripts, replaced with '_'
 * - specialReplacements: applied in order after questionableChars
 */
struct CharacterTables {
    std::u32string badChars;
    std::u32string questionableChars;
    std::vector<std::pair<std::u32string, std::u32string>> specialReplacements;

    static const CharacterTables& defaults();
};

/**
 * Removes and replaces characters that do not survive a transfer
 * between operating systems
 */
class CharacterSanitizer {
public:
    static constexpr const char32_t* PLACEHOLDER_PREFIX = U"unnamed_";
    static constexpr int PLACEHOLDER_MIN = 10000;
    static constexpr int PLACEHOLDER_MAX = 99999;

    CharacterSanitizer(const CharacterTables& tables, RandomSource& random);

    /**
     * Sanitize one name. Steps, in this order:
     * 1. remember whether the input already holds "__"
     * 2. replace bad characters with '_'
     * 3. drop control-category characters
     * 4. NFKC normalization, then step 2 again on its output
     * 5. strip trailing periods and spaces
     * 6. replace questionable characters, then special replacements
     * 7. spaces become '_'
     * 8. collapse runs of '_' unless step 1 found "__"
     * 9. collapse "_-_", "_-" and "-_" to '_'
     * 10. an empty result becomes "unnamed_NNNNN"
     *
     * @return Never empty
     */
    std::u32string sanitize(const std::u32string& name) const;

    std::string sanitize(const std::string& name) const;

    /**
     * Step 6 on its own
     */
    std::u32string removeQuestionableChars(std::u32string name) const;

    const CharacterTables& tables() const { return m_tables; }

private:
    CharacterTables m_tables;
    RandomSource& m_random;

    void replaceBadChars(std::u32string& name) const;
    std::u32string makePlaceholder() const;
};

} // namespace fns

#endif // FNSANITIZER_CHARACTER_SANITIZER_H
