#include "plugins/plugin.hpp"

namespace CssColors
{
    Plugin::Plugin( std::string name)
    : name_( std::move( name))
    {
    }

    std::string_view Plugin::getName() const
    {
        return name_;
    }
}
