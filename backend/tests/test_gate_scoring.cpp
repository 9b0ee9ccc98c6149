#include "TestSupport.hpp"
#include "../src/core/PrerequisiteGate.hpp"
#include "../src/core/ScoringEngine.hpp"

#include <algorithm>
#include <limits>

namespace {

EnrichedItem node(const std::string& id, std::vector<std::string> parents) {
    EnrichedItem e;
    e.item = makeItem(id, 0.0, 0);
    e.parent_ids = std::move(parents);
    return e;
}

bool containsId(const std::vector<GatedItem>& items, const std::string& id) {
    return std::any_of(items.begin(), items.end(),
        [&](const GatedItem& g) { return g.node.item.id == id; });
}

void gateBlocksUnsatisfiedParents(TestSuite& suite) {
    PrerequisiteGate gate;
    EnergyMap energies = { { "A", 0.5 }, { "B", 0.6 }, { "C", 0.1 } };

    auto eligible = gate.apply({ node("C", { "A", "B" }), node("D", { "C" }) }, energies);

    suite.require(containsId(eligible, "C"), "C should pass with parents at 0.5 and 0.6");
    suite.require(!containsId(eligible, "D"), "D must be blocked by C at 0.1");
    suite.require(eligible.size() == 1, "Only C should be eligible");
}

void gateTreatsMissingParentAsZero(TestSuite& suite) {
    PrerequisiteGate gate;
    EnergyMap energies = { { "A", 0.9 } };

    auto eligible = gate.apply({ node("X", { "A", "ghost" }) }, energies);
    suite.require(eligible.empty(), "Parent absent from energy map counts as 0.0");

    auto missing = gate.unsatisfiedParents({ "A", "ghost" }, energies);
    suite.require(missing.size() == 1 && missing[0] == "ghost",
                  "Only the missing parent is unsatisfied");
}

void gateThresholdIsInclusive(TestSuite& suite) {
    PrerequisiteGate gate;
    suite.require(near(gate.threshold(), 0.3), "Default threshold is 0.3");

    auto atThreshold = gate.apply({ node("X", { "P" }) }, { { "P", 0.3 } });
    suite.require(atThreshold.size() == 1, "Energy exactly at threshold passes");

    auto below = gate.apply({ node("X", { "P" }) }, { { "P", 0.2999 } });
    suite.require(below.empty(), "Energy just below threshold is blocked");

    SchedulerConfig strict;
    strict.mastery_threshold = 0.8;
    PrerequisiteGate strictGate(strict);
    suite.require(strictGate.apply({ node("X", { "P" }) }, { { "P", 0.7 } }).empty(),
                  "Configured threshold is honoured");
}

void readinessIsMeanParentEnergy(TestSuite& suite) {
    suite.require(PrerequisiteGate::readiness({}, {}) == 1.0,
                  "No parents gives readiness of exactly 1.0");
    suite.require(near(PrerequisiteGate::readiness({ "A", "B" }, { { "A", 0.5 }, { "B", 0.6 } }), 0.55),
                  "Readiness averages parent energies");
    suite.require(near(PrerequisiteGate::readiness({ "A", "B" }, { { "A", 0.8 } }), 0.4),
                  "Missing parent contributes 0.0 to readiness");

    PrerequisiteGate gate;
    auto eligible = gate.apply({ node("root", {}) }, {});
    suite.require(eligible.size() == 1 && eligible[0].readiness == 1.0,
                  "Root item is eligible with readiness 1.0");
}

void enrichAttachesParents(TestSuite& suite) {
    std::vector<CandidateItem> candidates = { makeItem("C", 0.1, NOW), makeItem("E", 0.0, 0) };
    ParentMap parents = { { "C", { "A", "B" } } };

    auto enriched = enrichCandidates(candidates, parents);
    suite.require(enriched.size() == 2, "Every candidate is kept");
    suite.require(enriched[0].parent_ids.size() == 2, "C gets both parents");
    suite.require(enriched[1].parent_ids.empty(), "E has no parents");
}

void daysOverdueUsesWholeDays(TestSuite& suite) {
    suite.require(ScoringEngine::daysOverdue(0, NOW) == 0.0, "Never scheduled is not overdue");
    suite.require(ScoringEngine::daysOverdue(NOW + DAY, NOW) == 0.0, "Future due date is not overdue");
    suite.require(ScoringEngine::daysOverdue(NOW, NOW) == 0.0, "Due now is zero days overdue");
    suite.require(ScoringEngine::daysOverdue(NOW - DAY + 1, NOW) == 0.0, "Partial day rounds down");
    suite.require(ScoringEngine::daysOverdue(NOW - 3 * DAY - 5, NOW) == 3.0, "Three and a bit days is 3");
}

void scoreFollowsFormula(TestSuite& suite) {
    Profile p{ 2.0, 1.0, 0.5, 0.25 };
    ScoringEngine engine(p);
    CandidateItem item = makeItem("X", 0.4, NOW - 4 * DAY, 0.6, 0.8);

    auto s = engine.score(item, 0.5, 4.0);
    double urgency = 1.0 + 2.0 * std::log(5.0);
    double potential = 1.0 * 0.5 + 0.5 * 0.6 + 0.25 * 0.8;

    suite.require(near(s.urgency_factor, urgency), "Urgency is 1 + w * ln(1 + d)");
    suite.require(near(s.learning_potential, potential), "Potential is the weighted sum");
    suite.require(near(s.final_score, urgency * potential), "Final score is the product");

    auto zero = engine.score(item, 0.5, 0.0);
    suite.require(near(zero.urgency_factor, 1.0), "Not overdue gives urgency 1.0");
}

void scoreIsMonotoneInDaysOverdue(TestSuite& suite) {
    ScoringEngine engine(Profile::balanced());
    CandidateItem item = makeItem("X", 0.4, 0, 0.3, 0.7);

    double previous = -1.0;
    bool monotone = true;
    for (int d = 0; d <= 60; ++d) {
        double s = engine.score(item, 0.8, static_cast<double>(d)).final_score;
        if (s < previous) monotone = false;
        previous = s;
    }
    suite.require(monotone, "Final score never decreases as days overdue grow");
}

void negativeWeightsAreClamped(TestSuite& suite) {
    Profile bad{ -1.0, std::numeric_limits<double>::quiet_NaN(), 1.0, 1.0 };
    ScoringEngine engine(bad);
    suite.require(engine.weights().urgency == 0.0, "Negative weight becomes 0");
    suite.require(engine.weights().readiness == 0.0, "NaN weight becomes 0");
    suite.require(engine.weights().foundation == 1.0, "Valid weight is kept");
}

void hugeUrgencyWithNoPotentialScoresZero(TestSuite& suite) {
    Profile extreme{ 1e308, 1.0, 1.0, 1.0 };
    ScoringEngine engine(extreme);
    CandidateItem empty = makeItem("empty", 0.0, NOW - 100 * DAY, 0.0, 0.0);

    auto s = engine.score(empty, 0.0, 100.0);
    suite.require(std::isinf(s.urgency_factor), "Urgency overflows to infinity");
    suite.require(s.final_score == 0.0, "Infinite urgency times zero potential scores 0");

    auto gated = [](CandidateItem c, double readiness) {
        GatedItem g;
        g.node.item = c;
        g.readiness = readiness;
        return g;
    };
    std::vector<GatedItem> eligible = {
        gated(empty, 0.0),
        gated(makeItem("rich", 0.0, NOW - 100 * DAY, 0.5, 0.5, 0.5, 2), 1.0),
        gated(makeItem("fresh", 0.0, 0, 0.5, 0.5, 0.5, 3), 1.0),
    };
    auto ranked = engine.rank(eligible, NOW);
    suite.require(ranked.size() == 3 && ranked[0].item().id == "rich" &&
                  ranked[1].item().id == "fresh" && ranked[2].item().id == "empty",
                  "Overflowing scores still rank in a total order");
}

void dueOffsetsAreBounded(TestSuite& suite) {
    auto later = dueAfterDays(NOW, 3);
    suite.require(later && *later == NOW + 3 * DAY, "Positive offset is in the future");
    auto earlier = dueAfterDays(NOW, -2);
    suite.require(earlier && *earlier == NOW - 2 * DAY, "Negative offset is overdue");
    suite.require(dueAfterDays(NOW, MAX_DUE_DAYS).has_value(), "Largest offset is accepted");
    suite.require(!dueAfterDays(NOW, MAX_DUE_DAYS + 1), "Offset past the limit is rejected");
    suite.require(!dueAfterDays(NOW, std::numeric_limits<long long>::min()), "Huge negative offset is rejected");
}

void rankBreaksTiesDeterministically(TestSuite& suite) {
    ScoringEngine engine(Profile::balanced());

    auto gated = [](CandidateItem c) {
        GatedItem g;
        g.node.item = c;
        return g;
    };

    // identical scores, ties resolved by canonical order, then id
    std::vector<GatedItem> eligible = {
        gated(makeItem("b", 0.5, 0, 0.5, 0.5, 0.5, 2)),
        gated(makeItem("a", 0.5, 0, 0.5, 0.5, 0.5, 2)),
        gated(makeItem("z", 0.5, 0, 0.5, 0.5, 0.5, 1)),
        gated(makeItem("top", 0.5, NOW - 10 * DAY, 0.5, 0.5, 0.5, 9)),
    };

    auto ranked = engine.rank(eligible, NOW);
    suite.require(ranked.size() == 4, "All eligible items are ranked");
    suite.require(ranked[0].item().id == "top", "Overdue item ranks first");
    suite.require(ranked[1].item().id == "z", "Lower canonical order wins a tie");
    suite.require(ranked[2].item().id == "a" && ranked[3].item().id == "b",
                  "Equal canonical order falls back to id");

    std::reverse(eligible.begin(), eligible.end());
    auto again = engine.rank(eligible, NOW);
    bool same = true;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        if (ranked[i].item().id != again[i].item().id) same = false;
    }
    suite.require(same, "Rank order does not depend on input order");
}

} // namespace

int main() {
    TestSuite suite;

    gateBlocksUnsatisfiedParents(suite);
    gateTreatsMissingParentAsZero(suite);
    gateThresholdIsInclusive(suite);
    readinessIsMeanParentEnergy(suite);
    enrichAttachesParents(suite);
    daysOverdueUsesWholeDays(suite);
    scoreFollowsFormula(suite);
    scoreIsMonotoneInDaysOverdue(suite);
    negativeWeightsAreClamped(suite);
    hugeUrgencyWithNoPotentialScoresZero(suite);
    dueOffsetsAreBounded(suite);
    rankBreaksTiesDeterministically(suite);

    return finish(suite, "Gate and scoring");
}
