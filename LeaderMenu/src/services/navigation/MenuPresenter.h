#pragma once

#include <string>

#include "model/ConfigTree.h"

namespace lmenu {

class NavigationState;

// The visible surface of the menu. Rendering is up to the implementation.
class MenuPresenter {
public:
    virtual ~MenuPresenter() = default;
    virtual void show(const NavigationState& state) = 0;
    virtual void hide() = 0;
    // Typed key matched nothing at the current level.
    virtual void notFound(const std::string& key) = 0;
    virtual void showCheatsheet(const NavigationState& state) = 0;
    // Navigation state changed while visible.
    virtual void refresh(const NavigationState& state) { (void)state; }
};

} // namespace lmenu
