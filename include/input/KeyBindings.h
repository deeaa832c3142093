#ifndef HOLDPLAY_INPUT_KEYBINDINGS_H
#define HOLDPLAY_INPUT_KEYBINDINGS_H

#include <Qt>

namespace HoldPlay::Input {

struct KeyBindings
{
    int togglePlay{Qt::Key_Space};
    int skipBackSmall{Qt::Key_X};
    int skipForwardSmall{Qt::Key_C};
    int skipBackLarge{Qt::Key_S};
    int skipForwardLarge{Qt::Key_D};
    int hold{Qt::Key_Z};

    double smallSkipSeconds{1.0};
    double largeSkipSeconds{10.0};
};

} // namespace HoldPlay::Input

#endif // HOLDPLAY_INPUT_KEYBINDINGS_H
