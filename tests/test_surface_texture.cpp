#include <gtest/gtest.h>
#include <pane/surface_texture.hpp>
#include "mock_display.hpp"
#include "mock_graphics_api.hpp"
#include <string>
#include <vector>

using namespace pane;
using pane::testing::MockDisplay;
using pane::testing::MockGraphicsApi;
using pane::testing::attribValue;

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

class SurfaceTextureTest : public ::testing::Test {
protected:
    void SetUp() override {
        display = std::make_shared<MockDisplay>();
        display->calls = &calls;
        gl.calls = &calls;
    }

    Surface makeSurface(Size size = {64, 64}, PixelFormat fmt = PixelFormat::RGBA8888) {
        return Surface::Make(display, ApiType::GLES, {3, 0}, size, fmt);
    }

    std::shared_ptr<MockDisplay> display;
    MockGraphicsApi gl;
    std::vector<std::string> calls;
};

// ---------------------------------------------------------------------------
// Make
// ---------------------------------------------------------------------------

TEST_F(SurfaceTextureTest, BindsSurfaceToNewTexture) {
    Surface surface = makeSurface();
    ASSERT_TRUE(surface.valid());
    EXPECT_EQ(attribValue(display->lastConfigAttribs, EGL_RENDERABLE_TYPE), EGL_OPENGL_ES3_BIT);

    Error err = Error::ImageBindFailed;
    auto texture = SurfaceTexture::Make(gl, surface, &err);
    ASSERT_NE(texture, nullptr);
    EXPECT_EQ(err, Error::None);

    EXPECT_EQ(gl.genCalls, 1);
    EXPECT_NE(texture->texture(), 0u);
    EXPECT_TRUE(texture->bound());
    EXPECT_EQ(texture->textureTarget(), static_cast<u32>(GL_TEXTURE_2D));
    EXPECT_EQ(display->bindCalls, 1);
    EXPECT_EQ(texture->surface(), surface);

    texture->destroy(gl);
}

TEST_F(SurfaceTextureTest, SetsNearestFilteringAndEdgeClamp) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);
    const u32 tex = texture->texture();

    EXPECT_EQ(gl.param(tex, GL_TEXTURE_MIN_FILTER), GL_NEAREST);
    EXPECT_EQ(gl.param(tex, GL_TEXTURE_MAG_FILTER), GL_NEAREST);
    EXPECT_EQ(gl.param(tex, GL_TEXTURE_WRAP_S), GL_CLAMP_TO_EDGE);
    EXPECT_EQ(gl.param(tex, GL_TEXTURE_WRAP_T), GL_CLAMP_TO_EDGE);

    texture->destroy(gl);
}

TEST_F(SurfaceTextureTest, LeavesTextureTargetUnboundAndNoError) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);

    EXPECT_EQ(gl.boundTexture, 0u);
    ASSERT_FALSE(gl.binds.empty());
    EXPECT_EQ(gl.binds.front(), std::make_pair(u32(GL_TEXTURE_2D), texture->texture()));
    EXPECT_EQ(gl.binds.back(), std::make_pair(u32(GL_TEXTURE_2D), 0u));
    EXPECT_EQ(gl.getError(), static_cast<u32>(GL_NO_ERROR));

    texture->destroy(gl);
}

TEST_F(SurfaceTextureTest, BindSequenceOrder) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);

    const std::vector<std::string> expected = {
        "genTexture", "bindTexture", "bindTexImage",
        "texParameteri", "texParameteri", "texParameteri", "texParameteri",
        "unbindTexture",
    };
    EXPECT_EQ(calls, expected);

    texture->destroy(gl);
}

TEST_F(SurfaceTextureTest, InvalidSurfaceIsRejected) {
    Error err = Error::None;
    auto texture = SurfaceTexture::Make(gl, Surface(), &err);
    EXPECT_EQ(texture, nullptr);
    EXPECT_EQ(err, Error::InvalidSurface);
    EXPECT_EQ(gl.genCalls, 0);
}

TEST_F(SurfaceTextureTest, TextureAllocationFailure) {
    gl.genSucceeds = false;

    Error err = Error::None;
    auto texture = SurfaceTexture::Make(gl, makeSurface(), &err);
    EXPECT_EQ(texture, nullptr);
    EXPECT_EQ(err, Error::TextureAllocationFailed);
    EXPECT_EQ(display->bindCalls, 0);
    EXPECT_TRUE(gl.deleted.empty());
}

TEST_F(SurfaceTextureTest, ImageBindFailureDeletesTexture) {
    display->bindSucceeds = false;

    Error err = Error::None;
    auto texture = SurfaceTexture::Make(gl, makeSurface(), &err);
    EXPECT_EQ(texture, nullptr);
    EXPECT_EQ(err, Error::ImageBindFailed);

    ASSERT_EQ(gl.genCalls, 1);
    ASSERT_EQ(gl.deleted.size(), 1u);
    EXPECT_EQ(gl.binds.front().second, gl.deleted[0]);
    EXPECT_EQ(gl.boundTexture, 0u);
    EXPECT_TRUE(gl.params.empty());
}

TEST_F(SurfaceTextureTest, FailedBindDropsConsumedSurface) {
    display->bindSucceeds = false;
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    EXPECT_EQ(texture, nullptr);
    EXPECT_EQ(display->destroyCalls.load(), 1);
}

// ---------------------------------------------------------------------------
// destroy / release
// ---------------------------------------------------------------------------

TEST_F(SurfaceTextureTest, ReleaseRoundTripPreservesSurface) {
    Surface surface = makeSurface({128, 32}, PixelFormat::BGRA8888);
    const u32 id = surface.id();

    auto texture = SurfaceTexture::Make(gl, std::move(surface));
    ASSERT_NE(texture, nullptr);

    Surface back = texture->release(gl);
    ASSERT_TRUE(back.valid());
    EXPECT_EQ(back.size(), (Size{128, 32}));
    EXPECT_EQ(back.format(), PixelFormat::BGRA8888);
    EXPECT_EQ(back.apiType(), ApiType::GLES);
    EXPECT_EQ(back.apiVersion(), (ApiVersion{3, 0}));
    EXPECT_EQ(back.id(), id);
    EXPECT_EQ(back.useCount(), 1);
    EXPECT_EQ(display->destroyCalls.load(), 0);
}

TEST_F(SurfaceTextureTest, ReleaseUnbindsThenDeletes) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);
    const u32 tex = texture->texture();
    calls.clear();

    texture->release(gl);

    const std::vector<std::string> expected = {"releaseTexImage", "deleteTexture"};
    EXPECT_EQ(calls, expected);
    ASSERT_EQ(gl.deleted.size(), 1u);
    EXPECT_EQ(gl.deleted[0], tex);
    EXPECT_EQ(texture->texture(), 0u);
    EXPECT_FALSE(texture->bound());
}

TEST_F(SurfaceTextureTest, DoubleDestroyDeletesOnce) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);

    texture->destroy(gl);
    texture->destroy(gl);

    EXPECT_EQ(gl.deleted.size(), 1u);
    EXPECT_EQ(display->releaseCalls, 1);
}

TEST_F(SurfaceTextureTest, DestroyKeepsSurfaceUntilBindingDropped) {
    auto texture = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(texture, nullptr);

    texture->destroy(gl);
    EXPECT_TRUE(texture->surface().valid());
    EXPECT_EQ(display->destroyCalls.load(), 0);

    texture.reset();
    EXPECT_EQ(display->destroyCalls.load(), 1);
}

TEST_F(SurfaceTextureTest, SharedSurfaceOutlivesBinding) {
    Surface surface = makeSurface();
    auto texture = SurfaceTexture::Make(gl, surface);
    ASSERT_NE(texture, nullptr);
    EXPECT_EQ(surface.useCount(), 2);

    texture->destroy(gl);
    texture.reset();
    EXPECT_EQ(display->destroyCalls.load(), 0);
    EXPECT_EQ(surface.useCount(), 1);
}

TEST_F(SurfaceTextureTest, ReleasedSurfaceCanBeBoundAgain) {
    auto first = SurfaceTexture::Make(gl, makeSurface());
    ASSERT_NE(first, nullptr);
    Surface surface = first->release(gl);

    auto second = SurfaceTexture::Make(gl, std::move(surface));
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second->texture(), 0u);
    EXPECT_EQ(gl.genCalls, 2);

    second->destroy(gl);
    EXPECT_EQ(gl.deleted.size(), 2u);
}
