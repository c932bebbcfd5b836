#pragma once
/*
 * ResponsePane
 *
 * Purpose: responses of the selected operation; one tab per status code in
 * document order, showing the application/json schema and the description.
 */
#include <string>
#include <vector>
#include "schema_pane.hpp"

class ResponsePane : public SchemaPane {
public:
  ResponsePane(const SharedNavigationState& state, const HighlightedDocumentBuilder& builder, const Theme& theme)
    : SchemaPane(state, builder, theme) {}
  const char* title() const override { return "Response"; }

protected:
  bool load(const NavigationState& s, std::vector<std::string>& tabs, int& tab,
            std::vector<HighlightedLine>& lines, Error& err) override;
  bool load_tab(const NavigationState& s, int tab, std::vector<HighlightedLine>& lines, Error& err) override;
  int draw_caption(Surface& body) const override;

private:
  bool build_response(const NavigationState& s, const std::vector<ResponseInfo>& responses, int tab,
                      std::vector<HighlightedLine>& lines, Error& err);
  std::string caption_;
};
