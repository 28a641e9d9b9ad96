#ifndef CSSCOLORS_PLUGIN_MANAGER_HPP
#define CSSCOLORS_PLUGIN_MANAGER_HPP

#include <memory>
#include <string_view>
#include <unordered_map>
#include "plugins/plugin.hpp"

namespace CssColors
{
    class PluginManager
    {
    public:
        static PluginManager *instance();

        // Replaces any plugin already installed under the same name.
        void install( std::unique_ptr<Plugin> plugin);

        void uninstall( std::string_view name);

        [[nodiscard]] Plugin *get( std::string_view name) const;

        template <typename Concrete>
        Concrete *get( std::string_view name) const
        {
            return dynamic_cast<Concrete *>( get( name));
        }

    private:
        std::unordered_map<std::string_view, std::unique_ptr<Plugin>> manager_;
    };
}

#endif //CSSCOLORS_PLUGIN_MANAGER_HPP
