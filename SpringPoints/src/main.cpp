#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include "app.h"
#include "renderer.h"
#include "ticker.h"
#include <cstdlib>
#include <cstdio>

// --- Application parameters ---
constexpr int   kInitialWidth     = 1280;
constexpr int   kInitialHeight    = 720;
constexpr float kTickPeriod       = 0.030f;   // ~33 Hz
constexpr float kMaxFrameDt       = 0.1f;
constexpr int   kMaxTicksPerFrame = 4;
constexpr Color kClearColor       = {1.0f, 1.0f, 1.0f};

// --- GLFW callbacks ---
// These run inside glfwPollEvents and only queue work for the frame loop.

static void framebuffer_size_callback(GLFWwindow* /*window*/, int width, int height) {
    glViewport(0, 0, width, height);
}

static void window_size_callback(GLFWwindow* window, int width, int height) {
    auto* app = static_cast<App*>(glfwGetWindowUserPointer(window));
    app->on_resized(width, height);
}

static void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
    auto* app = static_cast<App*>(glfwGetWindowUserPointer(window));
    app->on_pointer_moved(static_cast<float>(xpos), static_cast<float>(ypos));
}

static void key_callback(GLFWwindow* window, int key, int /*scancode*/,
                         int action, int mods) {
    if (action != GLFW_PRESS) return;
    auto* app = static_cast<App*>(glfwGetWindowUserPointer(window));

    if (key == GLFW_KEY_R && (mods & GLFW_MOD_CONTROL) != 0) {
        app->on_reset_requested();
    } else if (key == GLFW_KEY_ESCAPE) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

// --- Entry point ---

int main() {
    if (!glfwInit()) {
        std::fprintf(stderr, "Failed to initialise GLFW\n");
        return EXIT_FAILURE;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 6);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 4);

    GLFWwindow* window = glfwCreateWindow(kInitialWidth, kInitialHeight,
                                          "Spring Points", nullptr, nullptr);
    if (!window) {
        std::fprintf(stderr, "Failed to create window\n");
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwMakeContextCurrent(window);
    int version = gladLoadGL(glfwGetProcAddress);
    if (!version) {
        std::fprintf(stderr, "Failed to load OpenGL\n");
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }
    std::printf("OpenGL %d.%d\n", GLAD_VERSION_MAJOR(version),
                                   GLAD_VERSION_MINOR(version));

    glfwSwapInterval(1);
    glEnable(GL_MULTISAMPLE);

    int fb_w = 0, fb_h = 0;
    glfwGetFramebufferSize(window, &fb_w, &fb_h);
    glViewport(0, 0, fb_w, fb_h);

    // The window manager may not honour the requested size.
    int win_w = kInitialWidth, win_h = kInitialHeight;
    glfwGetWindowSize(window, &win_w, &win_h);

    Renderer renderer;
    renderer.init();
    renderer.set_clear_color(kClearColor);

    App app(win_w, win_h, kTickPeriod);
    FixedTicker ticker(kTickPeriod, kMaxFrameDt, kMaxTicksPerFrame);

    glfwSetWindowUserPointer(window, &app);
    glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);
    glfwSetWindowSizeCallback(window, window_size_callback);
    glfwSetCursorPosCallback(window, cursor_position_callback);
    glfwSetKeyCallback(window, key_callback);

    double prev_time = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        app.process_events();

        double now = glfwGetTime();
        float frame_dt = static_cast<float>(now - prev_time);
        prev_time = now;

        int due = ticker.advance(frame_dt);
        if (due == 0) {
            glfwWaitEventsTimeout(kTickPeriod - ticker.accumulator());
            continue;
        }
        for (int i = 0; i < due; ++i) {
            app.tick(renderer);
        }

        glfwSwapBuffers(window);
    }

    renderer.cleanup();
    glfwDestroyWindow(window);
    glfwTerminate();
    return EXIT_SUCCESS;
}
