#include <montecarlo/potentials.hpp>
#include <montecarlo/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace montecarlo {

namespace {

std::regex compile_pattern(const std::string& pattern, const std::string& owner) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigurationError("potential '" + owner + "' has an invalid pattern '" + pattern + "': " + e.what());
    }
}

void require_unit_interval(double value, const char* what) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError(std::string(what) + " must lie in [0, 1]");
    }
}

} // namespace

// === TextPotential ===

TextPotential::TextPotential(std::string name, PotentialScope scope)
    : name_(std::move(name)), scope_(scope) {}

double TextPotential::score(const SequenceView& view) const {
    if (scope_ == PotentialScope::Completion) {
        return view.complete ? score_text(view.content_text()) : 1.0;
    }
    if (view.new_tokens().empty()) {
        return 1.0;
    }
    return score_text(view.new_text());
}

// === PatternPotential ===

PatternPotential::PatternPotential(std::string name, const std::string& pattern, double match_score,
                                   double miss_score, PotentialScope scope)
    : TextPotential(name, scope),
      pattern_(compile_pattern(pattern, name)),
      match_score_(match_score),
      miss_score_(miss_score) {
    require_unit_interval(match_score_, "pattern match score");
    require_unit_interval(miss_score_, "pattern miss score");
}

double PatternPotential::score_text(const std::string& text) const {
    return std::regex_search(text, pattern_) ? match_score_ : miss_score_;
}

// === StylePotential ===

StylePotential::StylePotential(std::string name, const std::vector<StylePattern>& patterns, double floor,
                               PotentialScope scope)
    : TextPotential(name, scope), floor_(floor) {
    if (patterns.empty()) {
        throw ConfigurationError("style potential '" + name + "' needs at least one pattern");
    }
    require_unit_interval(floor_, "style floor");
    for (const auto& p : patterns) {
        if (!(p.weight >= 0.0) || std::isinf(p.weight)) {
            throw ConfigurationError("style weights must be finite and non-negative");
        }
        patterns_.emplace_back(compile_pattern(p.pattern, name), p.weight);
        total_weight_ += p.weight;
    }
}

double StylePotential::score_text(const std::string& text) const {
    if (total_weight_ <= 0.0) return 1.0;
    double matched = 0.0;
    for (const auto& [regex, weight] : patterns_) {
        if (std::regex_search(text, regex)) matched += weight;
    }
    return std::max(floor_, matched / total_weight_);
}

std::vector<StylePattern> StylePotential::formal_patterns() {
    return {
        {R"(\b(therefore|consequently|thus|hence|accordingly)\b)", 0.2},
        {R"(\b(furthermore|moreover|additionally|in addition)\b)", 0.2},
        {R"(\b(however|nevertheless|nonetheless|conversely)\b)", 0.2},
        {R"(\b(it is|there are|one must|it should be noted)\b)", 0.2},
        {R"([^.!?]+[.][^.!?]+[.][^.!?]+[.])", 0.2},
    };
}

std::vector<StylePattern> StylePotential::conversational_patterns() {
    return {
        {R"(\b(I think|I believe|I feel|I'd say)\b)", 0.2},
        {R"(\b(you know|right|actually|basically|honestly)\b)", 0.2},
        {R"(\b(like|so|well|anyway|I mean)\b)", 0.2},
        {R"([!?]{1,3})", 0.2},
        {R"(\b(can't|won't|don't|isn't|aren't|wasn't|weren't)\b)", 0.2},
    };
}

std::vector<StylePattern> StylePotential::technical_patterns() {
    return {
        {R"(\b(algorithm|function|method|implementation|system)\b)", 0.2},
        {R"(\b(data|input|output|parameter|variable)\b)", 0.2},
        {R"(\b(analysis|performance|efficiency|optimization)\b)", 0.2},
        {R"(\b(technical|specification|requirement|documentation)\b)", 0.2},
        {R"([a-zA-Z]+\([^)]*\))", 0.2},
    };
}

std::vector<StylePattern> StylePotential::creative_patterns() {
    return {
        {R"(\b(beautiful|stunning|gorgeous|magnificent|breathtaking)\b)", 0.2},
        {R"(\b(imagine|dream|wonder|fantasy|magical)\b)", 0.2},
        {R"([a-zA-Z]+ing [a-zA-Z]+ (like|as) [a-zA-Z]+)", 0.2},
        {R"([a-zA-Z]+ (is|was|are|were) [a-zA-Z]+)", 0.2},
        {R"([a-zA-Z]+, [a-zA-Z]+, and [a-zA-Z]+)", 0.2},
    };
}

// === ConstraintPotential ===

ConstraintPotential::ConstraintPotential(std::string name, std::vector<TextConstraint> constraints,
                                         PotentialScope scope)
    : TextPotential(std::move(name), scope), constraints_(std::move(constraints)) {
    for (const auto& c : constraints_) {
        if (!c) throw ConfigurationError("constraint function must not be empty");
    }
}

double ConstraintPotential::score_text(const std::string& text) const {
    double weakest = 1.0;
    for (const auto& constraint : constraints_) {
        weakest = std::min(weakest, constraint(text));
    }
    return weakest;
}

TextConstraint length_constraint(std::size_t min_length, std::size_t max_length) {
    if (min_length > max_length || max_length == 0) {
        throw ConfigurationError("length constraint needs 0 < max_length and min_length <= max_length");
    }
    return [min_length, max_length](const std::string& text) {
        const double length = static_cast<double>(text.size());
        if (text.size() >= min_length && text.size() <= max_length) return 1.0;
        if (text.size() < min_length) return std::max(0.1, length / static_cast<double>(min_length));
        return std::max(0.1, static_cast<double>(max_length) / length);
    };
}

TextConstraint required_elements_constraint(std::vector<std::string> elements, std::size_t threshold) {
    if (threshold == 0 || threshold > elements.size()) {
        throw ConfigurationError("required-elements threshold must lie in [1, element count]");
    }
    return [elements = std::move(elements), threshold](const std::string& text) {
        std::size_t found = 0;
        for (const auto& e : elements) {
            if (text.find(e) != std::string::npos) ++found;
        }
        if (found >= threshold) return 1.0;
        return std::max(0.1, static_cast<double>(found) / static_cast<double>(threshold));
    };
}

TextConstraint forbidden_content_constraint(std::vector<std::string> elements) {
    return [elements = std::move(elements)](const std::string& text) {
        for (const auto& e : elements) {
            if (!e.empty() && text.find(e) != std::string::npos) return 0.1;
        }
        return 1.0;
    };
}

// === EndsWithTerminalPunctuation ===

double EndsWithTerminalPunctuation::score(const SequenceView& view) const {
    if (!view.complete) return 1.0;
    auto content = view.content();
    for (auto it = content.rbegin(); it != content.rend(); ++it) {
        const Token& token = *it;
        auto last = std::find_if(token.rbegin(), token.rend(),
                                 [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
        if (last == token.rend()) continue;
        return (*last == '.' || *last == '!' || *last == '?') ? 1.0 : 0.0;
    }
    return 0.0;
}

// === BannedTokensPotential ===

BannedTokensPotential::BannedTokensPotential(std::vector<Token> banned)
    : banned_(banned.begin(), banned.end()) {}

bool BannedTokensPotential::is_satisfied(const SequenceView& view) const {
    for (const Token& token : view.new_tokens()) {
        if (banned_.count(token) > 0) return false;
    }
    return true;
}

double BannedTokensPotential::score(const SequenceView& view) const {
    return is_satisfied(view) ? 1.0 : 0.0;
}

// === CustomPotential ===

CustomPotential::CustomPotential(std::string name, Scorer scorer, bool efficient)
    : name_(std::move(name)), scorer_(std::move(scorer)), efficient_(efficient) {
    if (!scorer_) {
        throw ConfigurationError("custom potential '" + name_ + "' needs a scorer");
    }
}

} // namespace montecarlo
