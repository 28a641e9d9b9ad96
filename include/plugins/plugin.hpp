#ifndef CSSCOLORS_PLUGIN_HPP
#define CSSCOLORS_PLUGIN_HPP

#include <string>
#include <string_view>

namespace CssColors
{
    /*
     * An optional capability of the tool, such as writing image files,
     * looked up by name in the PluginManager.
     */
    class Plugin
    {
    public:
        explicit Plugin( std::string name);

        [[nodiscard]] virtual std::string_view getName() const;

        virtual ~Plugin() = default;
    private:
        std::string name_;
    };
}

#endif //CSSCOLORS_PLUGIN_HPP
