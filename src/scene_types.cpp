#include "scene_types.hpp"

namespace scenereel {

std::string to_string(SceneCategory category) {
    switch (category) {
        case SceneCategory::Action:
            return "Action Scene";
        case SceneCategory::Context:
            return "Context Scene";
    }
    return "Context Scene";
}

} // namespace scenereel
