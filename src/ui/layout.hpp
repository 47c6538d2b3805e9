#pragma once

#include <rack.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

using namespace rack;

namespace viewidget {
namespace ui {

/**
 * Panel geometry: HP conversions, screw placement and element lookup in the
 * panel SVG so controls follow the artwork.
 */
class PanelLayout {
public:
    static constexpr float HP_TO_MM = 5.08f;

    static float hp2px(float hp) {
        return rack::mm2px(hp * HP_TO_MM);
    }

    // Four corner screws inset one grid step from the edges
    template <typename TScrew = ScrewSilver>
    static void addScrews(ModuleWidget* widget) {
        float width = widget->box.size.x;
        widget->addChild(createWidget<TScrew>(Vec(RACK_GRID_WIDTH, 0)));
        widget->addChild(createWidget<TScrew>(Vec(width - 2 * RACK_GRID_WIDTH, 0)));
        widget->addChild(createWidget<TScrew>(Vec(RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH)));
        widget->addChild(createWidget<TScrew>(Vec(width - 2 * RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH)));
    }

    /**
     * Reads element positions (in mm) out of a panel SVG by id. Missing files,
     * ids or attributes fall back to the defaults given by the caller.
     *   PanelSvg svg(asset::plugin(pluginInstance, "res/panels/Viewidgets.svg"));
     *   Vec knob = svg.centerPx("dial_knob", 10.f, 90.f);
     */
    class PanelSvg {
    public:
        explicit PanelSvg(const std::string& path) {
            std::ifstream file(path);
            if (file) {
                std::stringstream ss;
                ss << file.rdbuf();
                text = ss.str();
            }
        }

        Vec centerMm(const std::string& id, float defx, float defy) const {
            std::string tag = findTag(id);
            if (tag.compare(0, 5, "<rect") == 0) {
                Rect r = rectFromTag(tag, Rect(Vec(defx, defy), Vec()));
                return r.getCenter();
            }
            return Vec(attr(tag, "cx", defx), attr(tag, "cy", defy));
        }

        Vec centerPx(const std::string& id, float defx, float defy) const {
            return rack::mm2px(centerMm(id, defx, defy));
        }

        Rect rectMm(const std::string& id, Rect fallback) const {
            return rectFromTag(findTag(id), fallback);
        }

        Rect rectPx(const std::string& id, Rect fallback) const {
            Rect r = rectMm(id, fallback);
            return Rect(rack::mm2px(r.pos), rack::mm2px(r.size));
        }

    private:
        std::string text;

        std::string findTag(const std::string& id) const {
            size_t pos = text.find("id=\"" + id + "\"");
            if (pos == std::string::npos) return std::string();
            size_t open = text.rfind('<', pos);
            size_t close = text.find('>', pos);
            if (open == std::string::npos || close == std::string::npos) return std::string();
            return text.substr(open, close - open + 1);
        }

        static Rect rectFromTag(const std::string& tag, Rect fallback) {
            return Rect(Vec(attr(tag, "x", fallback.pos.x), attr(tag, "y", fallback.pos.y)),
                        Vec(attr(tag, "width", fallback.size.x), attr(tag, "height", fallback.size.y)));
        }

        static float attr(const std::string& tag, const std::string& key, float defVal) {
            // Leading space so "x" does not match inside "cx"
            std::string needle = " " + key + "=\"";
            size_t p = tag.find(needle);
            if (p == std::string::npos) return defVal;
            p += needle.size();
            const char* begin = tag.c_str() + p;
            char* end = nullptr;
            float v = std::strtof(begin, &end);
            return (end == begin) ? defVal : v;
        }
    };
};

}} // namespace viewidget::ui
