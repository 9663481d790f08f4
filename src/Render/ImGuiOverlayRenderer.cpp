#include "ImGuiOverlayRenderer.hpp"
#include <imgui.h>

void ImGuiOverlayRenderer::drawLabeledBox(const sf::IntRect& bounds, const std::string& text,
                                          unsigned int fontSize, const sf::Color& textColor)
{
    ImDrawList* drawList = ImGui::GetForegroundDrawList();
    ImVec2 min((float)bounds.left, (float)bounds.top);
    ImVec2 max((float)(bounds.left + bounds.width), (float)(bounds.top + bounds.height));

    drawList->AddRectFilled(min, max, IM_COL32(0, 0, 0, 160));

    // Con tamaño 0 ImGui usaría el de la fuente por defecto; igual que sf::Text, no se dibuja
    if (fontSize == 0) return;
    drawList->AddText(ImGui::GetFont(), (float)fontSize, min,
                      IM_COL32(textColor.r, textColor.g, textColor.b, textColor.a),
                      text.c_str());
}
