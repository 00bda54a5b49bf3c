#ifndef MONTECARLO_POTENTIALS_HPP
#define MONTECARLO_POTENTIALS_HPP

#include <montecarlo/potential.hpp>
#include <functional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace montecarlo {

// Which text a text-based potential judges
enum class PotentialScope {
    NewContent,  // Tokens added this step; O(new tokens) per step
    Completion   // Whole generated text minus a trailing stop token, once the particle completes
};

/**
 * Base for potentials that judge joined token text.
 * Handles the scope so subclasses only score a string.
 */
class TextPotential : public Potential {
private:
    std::string name_;
    PotentialScope scope_;

protected:
    virtual double score_text(const std::string& text) const = 0;

public:
    TextPotential(std::string name, PotentialScope scope);

    std::string name() const override { return name_; }
    double score(const SequenceView& view) const override;

    PotentialScope scope() const { return scope_; }
};

// match_score when the regex is found in the text, miss_score otherwise
class PatternPotential : public TextPotential {
private:
    std::regex pattern_;
    double match_score_;
    double miss_score_;

protected:
    double score_text(const std::string& text) const override;

public:
    PatternPotential(std::string name, const std::string& pattern, double match_score = 1.0,
                     double miss_score = 0.0, PotentialScope scope = PotentialScope::NewContent);
};

struct StylePattern {
    std::string pattern;
    double weight;
};

/**
 * Fraction of style-pattern weight whose patterns occur in the text,
 * floored so an off-style candidate is discouraged rather than killed.
 */
class StylePotential : public TextPotential {
private:
    std::vector<std::pair<std::regex, double>> patterns_;
    double total_weight_ = 0.0;
    double floor_;

protected:
    double score_text(const std::string& text) const override;

public:
    StylePotential(std::string name, const std::vector<StylePattern>& patterns, double floor = 0.1,
                   PotentialScope scope = PotentialScope::Completion);

    static std::vector<StylePattern> formal_patterns();
    static std::vector<StylePattern> conversational_patterns();
    static std::vector<StylePattern> technical_patterns();
    static std::vector<StylePattern> creative_patterns();
};

using TextConstraint = std::function<double(const std::string& text)>;

// Minimum over constraint functions (the weakest constraint decides)
class ConstraintPotential : public TextPotential {
private:
    std::vector<TextConstraint> constraints_;

protected:
    double score_text(const std::string& text) const override;

public:
    ConstraintPotential(std::string name, std::vector<TextConstraint> constraints,
                        PotentialScope scope = PotentialScope::Completion);
};

// 1 inside [min_length, max_length] characters, decaying ratio outside, floored at 0.1
TextConstraint length_constraint(std::size_t min_length, std::size_t max_length);
// 1 when at least threshold elements occur, partial credit below, floored at 0.1
TextConstraint required_elements_constraint(std::vector<std::string> elements, std::size_t threshold = 1);
// 1 when no element occurs, 0.1 otherwise
TextConstraint forbidden_content_constraint(std::vector<std::string> elements);

// Complete sequences must end in '.', '!' or '?'; partial sequences score 1
class EndsWithTerminalPunctuation : public Potential {
public:
    std::string name() const override { return "ends_with_terminal_punctuation"; }
    double score(const SequenceView& view) const override;
};

// Hard constraint: any banned token among the new tokens scores 0
class BannedTokensPotential : public Potential {
private:
    std::unordered_set<Token> banned_;

public:
    explicit BannedTokensPotential(std::vector<Token> banned);

    std::string name() const override { return "banned_tokens"; }
    bool is_satisfied(const SequenceView& view) const override;
    double score(const SequenceView& view) const override;
};

// Wraps a caller-supplied scorer
class CustomPotential : public Potential {
public:
    using Scorer = std::function<double(const SequenceView&)>;

private:
    std::string name_;
    Scorer scorer_;
    bool efficient_;

public:
    CustomPotential(std::string name, Scorer scorer, bool efficient = true);

    std::string name() const override { return name_; }
    double score(const SequenceView& view) const override { return scorer_(view); }
    bool is_efficient() const override { return efficient_; }
};

} // namespace montecarlo

#endif // MONTECARLO_POTENTIALS_HPP
