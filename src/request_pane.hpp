#pragma once
/*
 * RequestPane
 *
 * Purpose: request body of the selected operation; one tab per media type,
 * application/json selected by default.
 */
#include <string>
#include "schema_pane.hpp"

class RequestPane : public SchemaPane {
public:
  RequestPane(const SharedNavigationState& state, const HighlightedDocumentBuilder& builder, const Theme& theme)
    : SchemaPane(state, builder, theme) {}
  const char* title() const override { return "Request"; }

protected:
  bool load(const NavigationState& s, std::vector<std::string>& tabs, int& tab,
            std::vector<HighlightedLine>& lines, Error& err) override;
  bool load_tab(const NavigationState& s, int tab, std::vector<HighlightedLine>& lines, Error& err) override;
  int draw_caption(Surface& body) const override;

private:
  std::string caption_;
};
