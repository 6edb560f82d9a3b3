#pragma once

#include "../types/context.hpp"

/**
 * @brief A piece of the settings surface drawn once per frame
 */
class IUiComponent {
  public:
    virtual ~IUiComponent() = default;

    /**
     * @brief Draw the component and record any requested change in ctx
     */
    virtual void render(Context &ctx) = 0;
};
