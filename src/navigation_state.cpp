#include "navigation_state.hpp"

const Operation* NavigationState::active_operation() const {
  if (!document || !selected) return nullptr;
  return document->operation(*selected);
}

NavigationState NavigationState::with_selection(std::optional<int> idx) const {
  NavigationState next;
  next.document = document;
  if (idx && document && document->operation(*idx)) next.selected = idx;
  return next;
}
