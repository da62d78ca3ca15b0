#include "fate_deck.hpp"

#include <algorithm>

bool operator==(const FateDeckState& a, const FateDeckState& b) {
    return a.drawPile == b.drawPile && a.discardPile == b.discardPile && a.stickyCards == b.stickyCards;
}

FateDrawResult resolveFateCard(const FateCard& card, double worldResonance) {
    FateDrawResult r;
    r.card = card;
    r.baseValue = card.baseValue;
    r.zone = ResonanceEngine::zoneFor(worldResonance);
    r.effectiveValue = card.baseValue;

    // Zone match, not value match: the first rule for the active zone wins.
    for (const auto& rule : card.resonanceRules) {
        if (rule.zone == r.zone) {
            r.appliedRule = rule;
            r.effectiveValue = card.baseValue + rule.modifyValue;
            break;
        }
    }

    r.drawEffects = card.onDrawEffects;
    return r;
}

FateDeckManager::FateDeckManager(std::vector<FateCard> cards, RNG& rng)
    : drawPile_(std::move(cards)), rng_(&rng) {
    for (const auto& c : drawPile_) registerSticky_(c);
    rng_->shuffle(drawPile_);
}

FateDeckManager::FateDeckManager(const FateDeckState& state, RNG& rng) : rng_(&rng) {
    restoreState(state);
}

std::optional<FateCard> FateDeckManager::draw() {
    if (drawPile_.empty()) {
        reshuffle();
    }
    if (drawPile_.empty()) return std::nullopt;

    FateCard card = drawPile_.front();
    drawPile_.erase(drawPile_.begin());
    discardPile_.push_back(card);
    return card;
}

std::optional<FateDrawResult> FateDeckManager::drawAndResolve(double worldResonance) {
    std::optional<FateCard> card = draw();
    if (!card) return std::nullopt;
    return resolveFateCard(*card, worldResonance);
}

void FateDeckManager::reshuffle() {
    for (const auto& s : sticky_) {
        if (!inPiles_(s.id)) discardPile_.push_back(s);
    }

    drawPile_.insert(drawPile_.end(), discardPile_.begin(), discardPile_.end());
    discardPile_.clear();
    rng_->shuffle(drawPile_);
}

void FateDeckManager::addCard(const FateCard& card) {
    registerSticky_(card);
    drawPile_.push_back(card);
    rng_->shuffle(drawPile_);
}

bool FateDeckManager::removeCard(const std::string& id) {
    auto match = [&](const FateCard& c) { return c.id == id; };

    bool found = false;
    auto it = std::find_if(drawPile_.begin(), drawPile_.end(), match);
    if (it != drawPile_.end()) {
        drawPile_.erase(it);
        found = true;
    } else {
        it = std::find_if(discardPile_.begin(), discardPile_.end(), match);
        if (it != discardPile_.end()) {
            discardPile_.erase(it);
            found = true;
        }
    }

    // Only forget a sticky card once no copy of it remains in the deck.
    if (found && !inPiles_(id)) {
        sticky_.erase(std::remove_if(sticky_.begin(), sticky_.end(), match), sticky_.end());
    }
    return found;
}

FateDeckState FateDeckManager::getState() const {
    FateDeckState s;
    s.drawPile = drawPile_;
    s.discardPile = discardPile_;
    s.stickyCards = sticky_;
    return s;
}

void FateDeckManager::restoreState(const FateDeckState& state) {
    drawPile_ = state.drawPile;
    discardPile_ = state.discardPile;
    sticky_ = state.stickyCards;
    // Older snapshots may not list sticky cards separately.
    for (const auto& c : drawPile_) registerSticky_(c);
    for (const auto& c : discardPile_) registerSticky_(c);
}

void FateDeckManager::registerSticky_(const FateCard& card) {
    if (!card.isSticky) return;
    for (const auto& s : sticky_) {
        if (s.id == card.id) return;
    }
    sticky_.push_back(card);
}

bool FateDeckManager::inPiles_(const std::string& id) const {
    auto match = [&](const FateCard& c) { return c.id == id; };
    return std::any_of(drawPile_.begin(), drawPile_.end(), match) ||
           std::any_of(discardPile_.begin(), discardPile_.end(), match);
}
