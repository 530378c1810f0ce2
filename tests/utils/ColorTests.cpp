/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ColorTests
#include <boost/test/unit_test.hpp>

#include "utils/Color.hpp"

using namespace TesselEngine;

BOOST_AUTO_TEST_SUITE(ColorParsingTests)

BOOST_AUTO_TEST_CASE(DefaultIsOpaqueWhite) {
    Color color;
    BOOST_CHECK_EQUAL(color, Color::white());
    BOOST_CHECK_EQUAL(color.a, 1.0f);
}

BOOST_AUTO_TEST_CASE(ParsesRgb) {
    auto color = Color::fromTiledString("#ff0000");
    BOOST_REQUIRE(color.has_value());
    BOOST_CHECK_EQUAL(*color, (Color{1.0f, 0.0f, 0.0f, 1.0f}));
}

BOOST_AUTO_TEST_CASE(ParsesAlphaFirst) {
    auto color = Color::fromTiledString("#800000ff");
    BOOST_REQUIRE(color.has_value());
    BOOST_CHECK_CLOSE(color->a, 128.0f / 255.0f, 0.001f);
    BOOST_CHECK_EQUAL(color->r, 0.0f);
    BOOST_CHECK_EQUAL(color->g, 0.0f);
    BOOST_CHECK_EQUAL(color->b, 1.0f);
}

BOOST_AUTO_TEST_CASE(HashIsOptional) {
    auto color = Color::fromTiledString("00FF00");
    BOOST_REQUIRE(color.has_value());
    BOOST_CHECK_EQUAL(*color, (Color{0.0f, 1.0f, 0.0f, 1.0f}));
}

BOOST_AUTO_TEST_CASE(RejectsMalformedText) {
    BOOST_CHECK(!Color::fromTiledString("").has_value());
    BOOST_CHECK(!Color::fromTiledString("#").has_value());
    BOOST_CHECK(!Color::fromTiledString("#fff").has_value());
    BOOST_CHECK(!Color::fromTiledString("#gg0000").has_value());
    BOOST_CHECK(!Color::fromTiledString("#ff00000").has_value());
    BOOST_CHECK(!Color::fromTiledString("red").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
