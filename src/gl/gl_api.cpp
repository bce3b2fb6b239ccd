// GL GraphicsApi - forwards texture calls to the current GL context.
//
// Only compiled when PANE_HAS_GL is defined (via CMake).

#include "pane/gl/gl_api.hpp"

#if PANE_HAS_GL

#include <GL/glew.h>
#include <cstdio>

namespace pane {

class GLGraphicsApi : public GraphicsApi {
public:
    u32 genTexture() override {
        GLuint tex = 0;
        glGenTextures(1, &tex);
        return tex;
    }

    void bindTexture(u32 target, u32 texture) override {
        glBindTexture(target, texture);
    }

    void texParameteri(u32 target, u32 pname, i32 param) override {
        glTexParameteri(target, pname, param);
    }

    void deleteTexture(u32 texture) override {
        GLuint tex = texture;
        glDeleteTextures(1, &tex);
    }

    u32 getError() override { return glGetError(); }
};

namespace GraphicsApis {

std::shared_ptr<GraphicsApi> MakeGL() {
    // GLEW requires this for core profiles and EGL environments.
    glewExperimental = GL_TRUE;
    const GLenum err = glewInit();
    // Clear any sticky errors introduced by glewInit.
    while (glGetError() != GL_NO_ERROR) {
    }

    if (err != GLEW_OK) {
        // EGL setups can report non-fatal GLEW init errors; keep going if GL is alive.
        if (glGetString(GL_VERSION) == nullptr) {
            std::fprintf(stderr, "pane GL: GLEW init failed: %s\n",
                         reinterpret_cast<const char*>(glewGetErrorString(err)));
            return nullptr;
        }
    }

    if (glGetString(GL_VERSION) == nullptr) {
        std::fprintf(stderr, "pane GL: no current GL context\n");
        return nullptr;
    }

    return std::make_shared<GLGraphicsApi>();
}

} // namespace GraphicsApis

} // namespace pane

#endif // PANE_HAS_GL
