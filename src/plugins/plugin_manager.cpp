#include "plugins/plugin_manager.hpp"

namespace CssColors
{
    PluginManager *PluginManager::instance()
    {
        static PluginManager manager;
        return &manager;
    }

    void PluginManager::install( std::unique_ptr<Plugin> plugin)
    {
        uninstall( plugin->getName());
        auto name = plugin->getName();
        manager_.emplace( name, std::move( plugin));
    }

    void PluginManager::uninstall( std::string_view name)
    {
        manager_.erase( name);
    }

    Plugin *PluginManager::get( std::string_view name) const
    {
        auto plugin_handle = manager_.find( name);
        return plugin_handle == manager_.cend() ? nullptr : plugin_handle->second.get();
    }
}
