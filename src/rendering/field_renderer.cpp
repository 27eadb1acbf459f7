#include "astrofield/rendering/field_renderer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "astrofield/core/constants.hpp"

sf::Color toSfColor(AsteroidColor color, sf::Uint8 alpha) {
    PaletteRgb const rgb = paletteRgb(color);
    return {rgb.r, rgb.g, rgb.b, alpha};
}

/**
 * @brief Linear blend between two colours, t in [0,1]
 */
static sf::Color mix(const sf::Color& a, const sf::Color& b, float t) {
    auto lerp = [t](sf::Uint8 x, sf::Uint8 y) {
        return static_cast<sf::Uint8>(static_cast<float>(x) + (static_cast<float>(y) - static_cast<float>(x)) * t);
    };
    return {lerp(a.r, b.r), lerp(a.g, b.g), lerp(a.b, b.b), lerp(a.a, b.a)};
}

// Rock shading
static const sf::Color RockBase(58, 65, 84);
static const sf::Color RockShadow(23, 25, 28);
static const sf::Color RockOutline(63, 101, 116);
static const sf::Color CraterDark(0, 0, 0, 89);
static const sf::Color CraterRim(255, 255, 255, 13);
static const sf::Color Highlight(255, 255, 255, 20);
static const sf::Color Background(4, 6, 16);

FieldRenderer::FieldRenderer(unsigned int width, unsigned int height, std::string fontPath)
    : screenWidth(width)
    , screenHeight(height)
    , fontPath(std::move(fontPath))
{
}

bool FieldRenderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Asteroid Field");
    window.setFramerateLimit(FieldConstants::TargetFramesPerSecond);

    if (!font.loadFromFile(fontPath)) {
        std::cerr << "Failed to load font " << fontPath << "\n";
        return false;
    }
    return true;
}

void FieldRenderer::clear() {
    window.clear(Background);
}

void FieldRenderer::present() {
    window.display();
}

void FieldRenderer::resize(unsigned int width, unsigned int height) {
    screenWidth = width;
    screenHeight = height;
    window.setView(sf::View(sf::FloatRect(0.f, 0.f,
                                          static_cast<float>(width),
                                          static_cast<float>(height))));
}

void FieldRenderer::renderField(const FieldSnapshot& snapshot, const std::vector<ProjectSeed>& projects) {
    for (const auto& body : snapshot.bodies) {
        renderAsteroid(body);
        if (body.collider) {
            renderCollider(*body.collider);
        }
    }

    if (!snapshot.labelsVisible) {
        return;
    }
    for (const auto& body : snapshot.bodies) {
        if (body.seedIndex < projects.size()) {
            renderLabel(body, projects[body.seedIndex], snapshot.label);
        }
    }
}

void FieldRenderer::renderAsteroid(const BodySnapshot& body) {
    float const size = static_cast<float>(body.size);
    sf::Color const tint = toSfColor(body.color);

    sf::Transform transform;
    transform.translate(static_cast<float>(body.position.x), static_cast<float>(body.position.y));
    transform.rotate(static_cast<float>(body.rotationDegrees));

    sf::ConvexShape rock;
    rock.setPointCount(body.localSilhouette.size());
    for (size_t i = 0; i < body.localSilhouette.size(); ++i) {
        const auto& v = body.localSilhouette[i];
        rock.setPoint(i, sf::Vector2f(static_cast<float>(v.x), static_cast<float>(v.y)));
    }

    // Glow: a slightly larger translucent copy behind the rock
    if (body.hovered) {
        sf::ConvexShape glow = rock;
        glow.setScale(1.12f, 1.12f);
        glow.setFillColor(toSfColor(body.color, 70));
        window.draw(glow, transform);
    }

    rock.setFillColor(body.hovered ? mix(tint, RockShadow, 0.35f) : RockBase);
    rock.setOutlineColor(body.hovered ? tint : RockOutline);
    rock.setOutlineThickness(body.hovered ? 2.f : 1.f);
    window.draw(rock, transform);

    // Darker rim on the side away from the light
    sf::ConvexShape shade = rock;
    shade.setOutlineThickness(0.f);
    shade.setScale(0.8f, 0.8f);
    shade.setPosition(size * 0.05f, size * 0.06f);
    shade.setFillColor(sf::Color(RockShadow.r, RockShadow.g, RockShadow.b, 90));
    window.draw(shade, transform);

    auto crater = [&](float cx, float cy, float r) {
        sf::CircleShape pit(r);
        pit.setOrigin(r, r);
        pit.setPosition(cx, cy);
        pit.setFillColor(CraterDark);
        window.draw(pit, transform);

        float const rimR = r * 0.55f;
        sf::CircleShape rim(rimR);
        rim.setOrigin(rimR, rimR);
        rim.setPosition(cx - r * 0.25f, cy - r * 0.25f);
        rim.setFillColor(CraterRim);
        window.draw(rim, transform);
    };
    crater(size * 0.14f, -size * 0.08f, size * 0.11f);
    crater(-size * 0.16f, size * 0.10f, size * 0.08f);
    crater(size * 0.02f, size * 0.18f, size * 0.06f);

    float const hr = size * 0.22f;
    sf::CircleShape highlight(hr);
    highlight.setOrigin(hr, hr);
    highlight.setPosition(-size * 0.18f, -size * 0.18f);
    highlight.setFillColor(Highlight);
    window.draw(highlight, transform);
}

void FieldRenderer::renderCollider(const Polygon& collider) {
    if (collider.empty()) {
        return;
    }
    sf::VertexArray outline(sf::LineStrip, collider.size() + 1);
    for (size_t i = 0; i <= collider.size(); ++i) {
        const auto& v = collider[i % collider.size()];
        outline[i].position = sf::Vector2f(static_cast<float>(v.x), static_cast<float>(v.y));
        outline[i].color = sf::Color(255, 60, 60, 200);
    }
    window.draw(outline);
}

void FieldRenderer::renderLabel(const BodySnapshot& body,
                                const ProjectSeed& project,
                                const Components::LabelLayout& layout) {
    float const left = static_cast<float>(body.labelAnchor.x - layout.width / 2.0);
    float const top = static_cast<float>(body.labelAnchor.y);

    sf::Text name(project.name, font, 16);
    name.setFillColor(body.hovered ? toSfColor(body.color) : sf::Color(220, 230, 240));
    sf::FloatRect const nb = name.getLocalBounds();
    name.setPosition(left + (static_cast<float>(layout.width) - nb.width) / 2.f - nb.left, top);
    window.draw(name);

    if (!project.tagline.empty()) {
        sf::Text tagline(project.tagline, font, 12);
        tagline.setFillColor(sf::Color(140, 150, 165));
        sf::FloatRect const tb = tagline.getLocalBounds();
        tagline.setPosition(left + (static_cast<float>(layout.width) - tb.width) / 2.f - tb.left, top + 22.f);
        window.draw(tagline);
    }
}

void FieldRenderer::renderText(const std::string& text, float x, float y, unsigned int size, sf::Color color) {
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    sfText.setPosition(x, y);
    window.draw(sfText);
}

void FieldRenderer::renderFPS(float fps) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "FPS: " << fps;
    renderText(oss.str(), 10.f, 10.f, 14, sf::Color::White);
}

void FieldRenderer::renderSelection(const ProjectSeed* project) {
    if (!project) {
        return;
    }
    std::ostringstream oss;
    oss << "Selected: " << project->name;
    if (hasLink(project->links.demo)) {
        oss << "  demo " << *project->links.demo;
    }
    if (hasLink(project->links.github)) {
        oss << "  code " << *project->links.github;
    }
    renderText(oss.str(), 10.f, static_cast<float>(screenHeight) - 30.f, 14, sf::Color(200, 220, 255));
}
