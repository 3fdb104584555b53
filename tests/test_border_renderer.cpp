// tests/test_border_renderer.cpp (doctest)

#include <doctest/doctest.h>

#include "border_renderer.h"
#include "province_map.h"
#include "test_support.h"

using namespace provmap_test;

TEST_SUITE("border_renderer") {

TEST_CASE("shift difference clears the exposed edge") {
    const sf::Image uniform = makeImage(3, 3, kRed);
    const sf::Image diff = shiftDifference(uniform, 1, 0);
    for (unsigned int y = 0; y < 3; ++y) {
        for (unsigned int x = 0; x < 3; ++x) {
            CHECK(diff.getPixel(x, y) == sf::Color::Black);
        }
    }

    const sf::Image borders = renderBorders(uniform);
    const sf::Image doubleBorders = renderDoubleBorders(uniform, true);
    for (unsigned int y = 0; y < 3; ++y) {
        for (unsigned int x = 0; x < 3; ++x) {
            CHECK(borders.getPixel(x, y) == sf::Color::White);
            CHECK(doubleBorders.getPixel(x, y) == sf::Color::White);
        }
    }
}

TEST_CASE("shift difference is a per-channel absolute difference") {
    sf::Image image = makeImage(2, 1, sf::Color(10, 200, 50));
    image.setPixel(1, 0, sf::Color(30, 100, 50));
    const sf::Image right = shiftDifference(image, 1, 0);
    CHECK(right.getPixel(1, 0) == sf::Color(20, 100, 0));
    const sf::Image left = shiftDifference(image, -1, 0);
    CHECK(left.getPixel(0, 0) == sf::Color(20, 100, 0));
    CHECK(left.getPixel(1, 0) == sf::Color::Black);
}

TEST_CASE("single borders mark one edge column, double borders both") {
    sf::Image image = makeImage(4, 2, kRed);
    paintRect(image, 2, 0, 4, 2, kBlue);

    const sf::Image single = renderBorders(image);
    for (unsigned int y = 0; y < 2; ++y) {
        CHECK_FALSE(isBorder(single, 0, y));
        CHECK_FALSE(isBorder(single, 1, y));
        CHECK(isBorder(single, 2, y));
        CHECK_FALSE(isBorder(single, 3, y));
    }

    const sf::Image both = renderDoubleBorders(image);
    for (unsigned int y = 0; y < 2; ++y) {
        CHECK_FALSE(isBorder(both, 0, y));
        CHECK(isBorder(both, 1, y));
        CHECK(isBorder(both, 2, y));
        CHECK_FALSE(isBorder(both, 3, y));
    }
}

TEST_CASE("thick borders add the diagonal neighbours") {
    sf::Image image = makeImage(3, 3, kRed);
    image.setPixel(1, 1, kBlue);

    const sf::Image thin = renderDoubleBorders(image, false);
    CHECK(isBorder(thin, 1, 1));
    CHECK(isBorder(thin, 1, 0));
    CHECK(isBorder(thin, 0, 1));
    CHECK_FALSE(isBorder(thin, 0, 0));
    CHECK_FALSE(isBorder(thin, 2, 2));

    const sf::Image thick = renderDoubleBorders(image, true);
    CHECK(isBorder(thick, 0, 0));
    CHECK(isBorder(thick, 2, 0));
    CHECK(isBorder(thick, 0, 2));
    CHECK(isBorder(thick, 2, 2));
}

TEST_CASE("excluding a neighbour keeps the borders between the others") {
    // A A B B
    // A A B B
    // C C C C
    sf::Image image = makeImage(4, 3, kRed);
    paintRect(image, 2, 0, 4, 2, kBlue);
    paintRect(image, 0, 2, 4, 3, kGreen);
    ProvinceColorTable table;
    table.add(1, kRed);
    table.add(2, kBlue);
    table.add(3, kGreen);
    const ProvinceMap provinces(image, table);

    sf::Image borders = renderDoubleBorders(image);
    REQUIRE(isBorder(borders, 0, 2));
    excludeRegions(borders, provinces, {3, 99});

    for (unsigned int x = 0; x < 4; ++x) {
        CHECK_FALSE(isBorder(borders, x, 2));
    }
    CHECK(isBorder(borders, 1, 0));
    CHECK(isBorder(borders, 2, 0));
    CHECK(isBorder(borders, 1, 1));
    CHECK(isBorder(borders, 2, 1));
    CHECK(isBorder(borders, 0, 1));
    CHECK_FALSE(isBorder(borders, 0, 0));
}

TEST_CASE("border style sets the polarity") {
    sf::Image image = makeImage(2, 1, kRed);
    image.setPixel(1, 0, kBlue);
    BorderStyle style;
    style.border = 255;
    style.background = 0;

    const sf::Image borders = renderBorders(image, style);
    CHECK(borders.getPixel(0, 0) == sf::Color::Black);
    CHECK(borders.getPixel(1, 0) == sf::Color::White);
}

TEST_CASE("overlay paints border pixels onto the background") {
    sf::Image image = makeImage(4, 2, kRed);
    paintRect(image, 2, 0, 4, 2, kBlue);
    const sf::Image borders = renderBorders(image);
    const sf::Image background = makeImage(4, 2, sf::Color(200, 200, 200));

    const sf::Image out = overlayBorders(background, borders, kYellow);
    CHECK(out.getPixel(2, 0) == kYellow);
    CHECK(out.getPixel(2, 1) == kYellow);
    CHECK(out.getPixel(1, 0) == sf::Color(200, 200, 200));
    CHECK(out.getPixel(3, 1) == sf::Color(200, 200, 200));
}

} // TEST_SUITE
