#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <core/util/wordlist.h>
#include <random>
#include <stdexcept>

namespace wormhole::core {

namespace {

// Three-syllable PGP words, used for even word positions
constexpr std::array<std::string_view, 256> kEvenWords{
    "adroitness", "adviser", "aftermath", "aggregate", "alkali", "almighty", "amulet", "amusement",
    "antenna", "applicant", "apollo", "armistice", "article", "asteroid", "atlantic", "atmosphere",
    "autopsy", "babylon", "backwater", "barbecue", "belowground", "bifocals", "bodyguard",
    "bookseller", "borderline", "bottomless", "bradbury", "bravado", "brazilian", "breakaway",
    "burlington", "businessman", "butterfat", "camelot", "candidate", "cannonball", "capricorn",
    "caravan", "caretaker", "celebrate", "cellulose", "certify", "chambermaid", "cherokee",
    "chicago", "clergyman", "coherence", "combustion", "commando", "company", "component",
    "concurrent", "confidence", "conformist", "congregate", "consensus", "consulting", "corporate",
    "corrosion", "councilman", "crossover", "crucifix", "cumbersome", "customer", "dakota",
    "decadence", "december", "decimal", "designing", "detector", "detergent", "determine",
    "dictator", "dinosaur", "direction", "disable", "disbelief", "disruptive", "distortion",
    "document", "embezzle", "enchanting", "enrollment", "enterprise", "equation", "equipment",
    "escapade", "eskimo", "everyday", "examine", "existence", "exodus", "fascinate", "filament",
    "finicky", "forever", "fortitude", "frequency", "gadgetry", "galveston", "getaway", "glossary",
    "gossamer", "graduate", "gravity", "guitarist", "hamburger", "hamilton", "handiwork",
    "hazardous", "headwaters", "hemisphere", "hesitate", "hideaway", "holiness", "hurricane",
    "hydraulic", "impartial", "impetus", "inception", "indigo", "inertia", "infancy", "inferno",
    "informant", "insincere", "insurgent", "integrate", "intention", "inventive", "istanbul",
    "jamaica", "jupiter", "leprosy", "letterhead", "liberty", "maritime", "matchmaker", "maverick",
    "medusa", "megaton", "microscope", "microwave", "midsummer", "millionaire", "miracle",
    "misnomer", "molasses", "molecule", "montana", "monument", "mosquito", "narrative", "nebula",
    "newsletter", "norwegian", "october", "ohio", "onlooker", "opulent", "orlando", "outfielder",
    "pacific", "pandemic", "pandora", "paperweight", "paragon", "paragraph", "paramount",
    "passenger", "pedigree", "pegasus", "penetrate", "perceptive", "performance", "pharmacy",
    "phonetic", "photograph", "pioneer", "pocketful", "politeness", "positive", "potato",
    "processor", "provincial", "proximate", "puberty", "publisher", "pyramid", "quantity",
    "racketeer", "rebellion", "recipe", "recover", "repellent", "replica", "reproduce", "resistor",
    "responsive", "retraction", "retrieval", "retrospect", "revenue", "revival", "revolver",
    "sandalwood", "sardonic", "saturday", "savagery", "scavenger", "sensation", "sociable",
    "souvenir", "specialist", "speculate", "stethoscope", "stupendous", "supportive", "surrender",
    "suspicious", "sympathy", "tambourine", "telephone", "therapist", "tobacco", "tolerance",
    "tomorrow", "torpedo", "tradition", "travesty", "trombonist", "truncated", "typewriter",
    "ultimate", "undaunted", "underfoot", "unicorn", "unify", "universe", "unravel", "upcoming",
    "vacancy", "vagabond", "vertigo", "virginia", "visitor", "vocalist", "voyager", "warranty",
    "waterloo", "whimsical", "wichita", "wilmington", "wyoming", "yesteryear", "yucatan",
};

// Two-syllable PGP words, used for odd word positions
constexpr std::array<std::string_view, 256> kOddWords{
    "aardvark", "absurd", "accrue", "acme", "adrift", "adult", "afflict", "ahead", "aimless",
    "algol", "allow", "alone", "ammo", "ancient", "apple", "artist", "assume", "athens", "atlas",
    "aztec", "baboon", "backfield", "backward", "banjo", "beaming", "bedlamp", "beehive",
    "beeswax", "befriend", "belfast", "berserk", "billiard", "bison", "blackjack", "blockade",
    "blowtorch", "bluebird", "bombast", "bookshelf", "brackish", "breadline", "breakup",
    "brickyard", "briefcase", "burbank", "button", "buzzard", "cement", "chairlift", "chatter",
    "checkup", "chisel", "choking", "chopper", "christmas", "clamshell", "classic", "classroom",
    "cleanup", "clockwork", "cobra", "commence", "concert", "cowbell", "crackdown", "cranky",
    "crowfoot", "crucial", "crumpled", "crusade", "cubic", "dashboard", "deadbolt", "deckhand",
    "dogsled", "dragnet", "drainage", "dreadful", "drifter", "dropper", "drumbeat", "drunken",
    "dupont", "dwelling", "eating", "edict", "egghead", "eightball", "endorse", "endow", "enlist",
    "erase", "escape", "exceed", "eyeglass", "eyetooth", "facial", "fallout", "flagpole",
    "flatfoot", "flytrap", "fracture", "framework", "freedom", "frighten", "gazelle", "geiger",
    "glitter", "glucose", "goggles", "goldfish", "gremlin", "guidance", "hamlet", "highchair",
    "hockey", "indoors", "indulge", "inverse", "involve", "island", "jawbone", "keyboard",
    "kickoff", "kiwi", "klaxon", "locale", "lockup", "merit", "minnow", "miser", "mohawk", "mural",
    "music", "necklace", "neptune", "newborn", "nightbird", "oakland", "obtuse", "offload",
    "optic", "orca", "payday", "peachy", "pheasant", "physique", "playhouse", "pluto", "preclude",
    "prefer", "preshrunk", "printer", "prowler", "pupil", "puppy", "python", "quadrant", "quiver",
    "quota", "ragtime", "ratchet", "rebirth", "reform", "regain", "reindeer", "rematch", "repay",
    "retouch", "revenge", "reward", "rhythm", "ribcage", "ringbolt", "robust", "rocker", "ruffled",
    "sailboat", "sawdust", "scallion", "scenic", "scorecard", "scotland", "seabird", "select",
    "sentence", "shadow", "shamrock", "showgirl", "skullcap", "skydive", "slingshot", "slowdown",
    "snapline", "snapshot", "snowcap", "snowslide", "solo", "southward", "soybean", "spaniel",
    "spearhead", "spellbind", "spheroid", "spigot", "spindle", "spyglass", "stagehand", "stagnate",
    "stairway", "standard", "stapler", "steamship", "sterling", "stockman", "stopwatch", "stormy",
    "sugar", "surmount", "suspense", "sweatband", "swelter", "tactics", "talon", "tapeworm",
    "tempest", "tiger", "tissue", "tonic", "topmost", "tracker", "transit", "trauma", "treadmill",
    "trojan", "trouble", "tumor", "tunnel", "tycoon", "uncut", "unearth", "unwind", "uproot",
    "upset", "upshot", "vapor", "village", "virus", "vulcan", "waffle", "wallet", "watchword",
    "wayside", "willow", "woodlark", "zulu",
};

std::size_t CountDashes(std::string_view text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '-'));
}

} // namespace

Wordlist::Wordlist(std::size_t num_words, std::vector<std::vector<std::string>> words)
    : num_words_(num_words)
    , words_(std::move(words)) {
    if (words_.empty()) {
        throw std::invalid_argument("a wordlist needs at least one list of words");
    }
    for (const auto& list : words_) {
        if (list.empty()) {
            throw std::invalid_argument("a wordlist cannot contain an empty list");
        }
    }
}

Wordlist Wordlist::Default(std::size_t num_words) {
    std::vector<std::string> even(kEvenWords.begin(), kEvenWords.end());
    std::vector<std::string> odd(kOddWords.begin(), kOddWords.end());
    return Wordlist(num_words, {std::move(even), std::move(odd)});
}

std::string Wordlist::ChooseWords() const {
    std::random_device rd;
    std::string result;
    for (std::size_t i = 0; i < num_words_; ++i) {
        const auto& list = words_[i % words_.size()];
        std::uniform_int_distribution<std::size_t> pick(0, list.size() - 1);
        if (!result.empty()) {
            result += '-';
        }
        result += list[pick(rd)];
    }
    return result;
}

std::vector<std::string> Wordlist::GetCompletions(std::string_view prefix) const {
    auto dashes = CountDashes(prefix);
    if (dashes == 0) {
        return {};
    }
    const auto& list = words_[(dashes - 1) % words_.size()];

    auto split = prefix.rfind('-');
    auto head = prefix.substr(0, split + 1);
    auto partial = prefix.substr(split + 1);

    std::vector<std::string> completions;
    for (const auto& word : list) {
        if (word.compare(0, partial.size(), partial) == 0) {
            completions.emplace_back(std::string(head) + word);
        }
    }
    return completions;
}

const std::vector<std::string>& Wordlist::GetWordlist(std::string_view prefix,
                                                      std::optional<std::size_t> cursor_pos) const {
    auto limited = prefix;
    if (cursor_pos && *cursor_pos < prefix.size()) {
        limited = prefix.substr(0, *cursor_pos);
    }
    auto dashes = CountDashes(limited);
    auto position = dashes == 0 ? 0 : dashes - 1;
    return words_[position % words_.size()];
}

std::string_view ExtractPartialFromPrefix(std::string_view prefix, std::size_t pos) {
    pos = std::min(pos, prefix.size());
    auto start = prefix.substr(0, pos).rfind('-');
    auto word_start = start == std::string_view::npos ? 0 : start + 1;
    auto end = prefix.find('-', pos);
    auto word_end = end == std::string_view::npos ? prefix.size() : end;
    return prefix.substr(word_start, word_end - word_start);
}

std::optional<int> ParseNameplate(std::string_view code) {
    auto dash = code.find('-');
    auto nameplate = code.substr(0, dash);
    if (nameplate.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(nameplate.data(), nameplate.data() + nameplate.size(), value);
    if (ec != std::errc{} || ptr != nameplate.data() + nameplate.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

bool IsValidCode(std::string_view code) {
    if (!ParseNameplate(code)) {
        return false;
    }
    auto dash = code.find('-');
    if (dash == std::string_view::npos) {
        return false;
    }
    auto rest = code.substr(dash + 1);
    if (rest.empty()) {
        return false;
    }
    std::size_t start = 0;
    while (start <= rest.size()) {
        auto end = rest.find('-', start);
        auto word = rest.substr(start, end == std::string_view::npos ? end : end - start);
        if (word.empty()) {
            return false;
        }
        for (char c : word) {
            auto ch = static_cast<unsigned char>(c);
            if (std::isspace(ch) || !std::isprint(ch)) {
                return false;
            }
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return true;
}

std::string GenerateCode(int nameplate, const Wordlist& wordlist) {
    return std::to_string(nameplate) + "-" + wordlist.ChooseWords();
}

std::string CompleteCode(std::string_view code, const Wordlist& wordlist) {
    std::string result;
    std::size_t start = 0;
    bool nameplate = true;
    while (true) {
        auto end = code.find('-', start);
        auto word = code.substr(start, end == std::string_view::npos ? end : end - start);
        if (nameplate) {
            result.append(word);
            nameplate = false;
        } else {
            result += '-';
            auto completions = wordlist.GetCompletions(result + std::string(word));
            if (completions.size() == 1) {
                result = std::move(completions.front());
            } else {
                result.append(word);
            }
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return result;
}

} // namespace wormhole::core
