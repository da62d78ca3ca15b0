#pragma once

#include "fate_card.hpp"
#include "rng.hpp"

#include <optional>
#include <string>
#include <vector>

// Outcome of one draw resolved against the world resonance.
// Lives only as long as the action that produced it.
struct FateDrawResult {
    FateCard card;
    int baseValue = 0;
    int effectiveValue = 0;                     // baseValue + matching rule delta
    std::optional<FateResonanceRule> appliedRule; // first rule whose zone matched
    std::vector<FateDrawEffect> drawEffects;    // for the caller to apply
    ResonanceZone zone = ResonanceZone::Yav;

    bool isCritical() const { return card.isCritical; }
};

// Exact pile snapshot (top of each pile is index 0).
struct FateDeckState {
    std::vector<FateCard> drawPile;
    std::vector<FateCard> discardPile;
    // Sticky cards the deck has ever held and not had explicitly removed.
    std::vector<FateCard> stickyCards;
};

bool operator==(const FateDeckState& a, const FateDeckState& b);

// Owns the draw and discard piles. The RNG is borrowed (the encounter owns it)
// so that shuffles share the encounter's single deterministic stream.
class FateDeckManager {
public:
    // Shuffles `cards` into the draw pile immediately.
    FateDeckManager(std::vector<FateCard> cards, RNG& rng);

    // Restores an exact snapshot without shuffling.
    FateDeckManager(const FateDeckState& state, RNG& rng);

    // Top card moves to the discard pile. Reshuffles first if the draw pile is
    // empty; nullopt only when the deck holds no cards at all.
    std::optional<FateCard> draw();

    std::optional<FateDrawResult> drawAndResolve(double worldResonance);

    // Discard pile (plus any sticky card no longer in either pile) becomes the
    // new draw pile in RNG order.
    void reshuffle();

    // Mid-encounter boon/curse: inserted into the draw pile, which is reshuffled.
    void addCard(const FateCard& card);

    // Removes the first card with this id from the draw pile, else the discard
    // pile. Removing a sticky card lifts it for good.
    bool removeCard(const std::string& id);

    FateDeckState getState() const;
    void restoreState(const FateDeckState& state);

    const std::vector<FateCard>& drawPile() const { return drawPile_; }
    const std::vector<FateCard>& discardPile() const { return discardPile_; }

    int drawCount() const { return static_cast<int>(drawPile_.size()); }
    int discardCount() const { return static_cast<int>(discardPile_.size()); }
    int totalCount() const { return drawCount() + discardCount(); }
    bool empty() const { return drawPile_.empty() && discardPile_.empty(); }

    void setRng(RNG& rng) { rng_ = &rng; }

private:
    void registerSticky_(const FateCard& card);
    bool inPiles_(const std::string& id) const;

    std::vector<FateCard> drawPile_;
    std::vector<FateCard> discardPile_;
    std::vector<FateCard> sticky_;
    RNG* rng_ = nullptr;
};

// Applies the first matching zone rule. Pure; used by drawAndResolve.
FateDrawResult resolveFateCard(const FateCard& card, double worldResonance);
