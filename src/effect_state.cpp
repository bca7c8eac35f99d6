#include "spritefx/effect_state.hpp"

#include <algorithm>

namespace spritefx {

EffectState::EffectState(std::shared_ptr<const EffectRegistry> effects)
    : effects_(std::move(effects)),
      values_(effects_->count(), 0.0) {
}

bool EffectState::set(std::string_view name, f64 value) {
    const Effect* e = effects_->find(name);
    if (!e) return false;

    values_[e->bitPosition] = value;
    if (value != 0.0) {
        bits_ |= e->mask();
    } else {
        bits_ &= ~e->mask();
    }
    return true;
}

f64 EffectState::value(std::string_view name) const {
    const Effect* e = effects_->find(name);
    return e ? values_[e->bitPosition] : 0.0;
}

f64 EffectState::uniformValue(u32 index) const {
    return effects_->at(index).convert(values_[index]);
}

bool EffectState::shapeChanges() const {
    for (const Effect& e : effects_->effects()) {
        if (e.shapeChanges && (bits_ & e.mask())) return true;
    }
    return false;
}

void EffectState::reset() {
    std::fill(values_.begin(), values_.end(), 0.0);
    bits_ = 0;
}

} // namespace spritefx
