#pragma once

#include <core/constant/transfer.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::core {

// Word source for codes of the form "<nameplate>-<word>-<word>...". Word positions
// alternate between the lists in words (position 0 uses words[0]).
class Wordlist {
public:
    Wordlist(std::size_t num_words, std::vector<std::vector<std::string>> words);

    // PGP word list: three-syllable words first, two-syllable words second
    static Wordlist Default(std::size_t num_words = transfer::kDefaultCodeLength);

    std::size_t num_words() const { return num_words_; }
    const std::vector<std::vector<std::string>>& words() const { return words_; }

    std::string ChooseWords() const;

    // Completions of the word under the end of a code prefix, e.g. "7-cro" -> "7-crossover".
    // Nothing is completed while the nameplate is being typed.
    std::vector<std::string> GetCompletions(std::string_view prefix) const;

    // The list the word at cursor_pos (default: end of prefix) is drawn from
    const std::vector<std::string>& GetWordlist(std::string_view prefix,
                                                std::optional<std::size_t> cursor_pos
                                                = std::nullopt) const;

private:
    std::size_t num_words_;
    std::vector<std::vector<std::string>> words_;
};

// The dash-delimited word around pos
std::string_view ExtractPartialFromPrefix(std::string_view prefix, std::size_t pos);

std::optional<int> ParseNameplate(std::string_view code);

// "<positive nameplate>-<word>[-<word>...]", no whitespace, no empty words
bool IsValidCode(std::string_view code);

std::string GenerateCode(int nameplate, const Wordlist& wordlist);

// Expands every word that is an unambiguous prefix of a wordlist entry:
// "7-cros-cl" becomes "7-crossover-cl" ("cl" matches several words)
std::string CompleteCode(std::string_view code, const Wordlist& wordlist);

} // namespace wormhole::core
