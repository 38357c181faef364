/// @file shape.cpp
/// @brief Disc and Polyline queries on top of Box2D's narrow phase.
///
/// Discs map to b2Circle, contour edges to b2Segment, and separations come
/// from GJK (b2ShapeDistance) over point and segment proxies.  A Polyline
/// is concave in general, so it is handled edge by edge; containment
/// counts the edges a +X ray crosses (even-odd rule).

#include "gw/game/shape.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

#include <box2d/box2d.h>

namespace gw::game {

namespace {

constexpr float kBoundaryEpsilon = 1e-5f;

b2Vec2 toB2(const Vector2& v) {
    return b2Vec2{v.x, v.y};
}

b2Transform toB2(const ShapeTransform& tf) {
    return b2Transform{toB2(tf.translation), b2Rot{std::cos(tf.rotation), std::sin(tf.rotation)}};
}

/// Contour vertices in world space.
std::vector<b2Vec2> worldPoints(const Polyline& poly, const ShapeTransform& tf) {
    const b2Transform xf = toB2(tf);
    std::vector<b2Vec2> out;
    out.reserve(poly.points.size());
    for (const auto& p : poly.points) {
        out.push_back(b2TransformPoint(xf, toB2(p)));
    }
    return out;
}

/// Call @p fn(a, b) for every edge of the closed contour.  A single
/// vertex yields one degenerate edge so that it still has a proxy.
template <typename Fn>
void forEachEdge(const std::vector<b2Vec2>& pts, Fn&& fn) {
    const std::size_t n = pts.size();
    if (n == 1) {
        fn(pts[0], pts[0]);
        return;
    }
    for (std::size_t i = 0; i < n; ++i) {
        fn(pts[i], pts[(i + 1) % n]);
    }
}

b2ShapeProxy pointProxy(const b2Vec2& p) {
    return b2MakeProxy(&p, 1, 0.0f);
}

b2ShapeProxy edgeProxy(const b2Vec2& a, const b2Vec2& b) {
    const b2Vec2 pts[2] = {a, b};
    return b2MakeProxy(pts, (a.x == b.x && a.y == b.y) ? 1 : 2, 0.0f);
}

/// GJK distance between two world-space proxies (radii not applied).
float proxyDistance(const b2ShapeProxy& a, const b2ShapeProxy& b) {
    b2DistanceInput input{};
    input.proxyA = a;
    input.proxyB = b;
    input.transformA = b2Transform_identity;
    input.transformB = b2Transform_identity;
    input.useRadii = false;

    b2SimplexCache cache{};
    return b2ShapeDistance(&input, &cache, nullptr, 0).distance;
}

/// Ray parameter in [0, 1] at which `origin + f * translation` first
/// crosses segment [a, b].
std::optional<float> castSegment(const b2Vec2& origin, const b2Vec2& translation,
                                 const b2Vec2& a, const b2Vec2& b) {
    const b2RayCastInput input{origin, translation, 1.0f};
    const b2Segment segment{a, b};
    const b2CastOutput output = b2RayCastSegment(&input, &segment, false);
    if (!output.hit) {
        return std::nullopt;
    }
    return output.fraction;
}

/// Even-odd containment; points on an edge count as inside.
bool polygonContains(const std::vector<b2Vec2>& pts, const b2Vec2& p) {
    if (pts.empty()) {
        return false;
    }
    const b2ShapeProxy point = pointProxy(p);
    bool onEdge = false;
    forEachEdge(pts, [&](const b2Vec2& a, const b2Vec2& b) {
        onEdge = onEdge || proxyDistance(point, edgeProxy(a, b)) <= kBoundaryEpsilon;
    });
    if (onEdge || pts.size() < 3) {
        return onEdge;
    }

    // Long enough to leave the contour's bounding box.
    float reach = 1.0f;
    for (const auto& v : pts) {
        reach = std::max(reach, std::fabs(v.x - p.x) + 1.0f);
    }
    const b2Vec2 ray{2.0f * reach, 0.0f};

    bool inside = false;
    forEachEdge(pts, [&](const b2Vec2& a, const b2Vec2& b) {
        // Half-open in y, so a vertex on the ray is counted once.
        if ((a.y > p.y) != (b.y > p.y) && castSegment(p, ray, a, b)) {
            inside = !inside;
        }
    });
    return inside;
}

bool discContains(const Disc& disc, const ShapeTransform& tf, const b2Vec2& p) {
    return proxyDistance(pointProxy(p), pointProxy(toB2(tf.translation))) <=
           disc.radius + kBoundaryEpsilon;
}

// ── TimeOfImpact overloads ──────────────────────────────────────────────

std::optional<float> toi(const Disc& disc, const ShapeTransform& tf,
                         const Vector2& origin, const Vector2& dir,
                         float maxTime, bool solid) {
    const b2Vec2 start = toB2(origin);
    const bool inside = discContains(disc, tf, start);
    if (inside && solid) {
        return 0.0f;
    }
    const b2Vec2 translation = b2MulSV(maxTime, toB2(dir));
    if (b2LengthSquared(translation) <= 0.0f) {
        return std::nullopt;
    }

    const b2Circle circle{toB2(tf.translation), disc.radius};
    if (!inside) {
        const b2RayCastInput input{start, translation, 1.0f};
        const b2CastOutput output = b2RayCastCircle(&input, &circle);
        if (!output.hit) {
            return std::nullopt;
        }
        return output.fraction * maxTime;
    }

    // Hollow and starting inside: cast back from the end of the ray to
    // find where it leaves the circle.
    const b2Vec2 end = b2Add(start, translation);
    if (discContains(disc, tf, end)) {
        return std::nullopt;
    }
    const b2RayCastInput back{end, b2Neg(translation), 1.0f};
    const b2CastOutput output = b2RayCastCircle(&back, &circle);
    if (!output.hit) {
        return std::nullopt;
    }
    return (1.0f - output.fraction) * maxTime;
}

std::optional<float> toi(const Polyline& poly, const ShapeTransform& tf,
                         const Vector2& origin, const Vector2& dir,
                         float maxTime, bool solid) {
    const auto pts = worldPoints(poly, tf);
    const b2Vec2 start = toB2(origin);
    if (solid && polygonContains(pts, start)) {
        return 0.0f;
    }
    const b2Vec2 translation = b2MulSV(maxTime, toB2(dir));
    if (b2LengthSquared(translation) <= 0.0f || pts.size() < 2) {
        return std::nullopt;
    }

    std::optional<float> best;
    forEachEdge(pts, [&](const b2Vec2& a, const b2Vec2& b) {
        auto fraction = castSegment(start, translation, a, b);
        if (fraction && (!best || *fraction < *best)) {
            best = fraction;
        }
    });
    if (!best) {
        return std::nullopt;
    }
    return *best * maxTime;
}

// ── Separation overloads (<= 0 means overlapping) ───────────────────────

float separation(const Disc& a, const ShapeTransform& ta,
                 const Disc& b, const ShapeTransform& tb) {
    return proxyDistance(pointProxy(toB2(ta.translation)), pointProxy(toB2(tb.translation))) -
           a.radius - b.radius;
}

float separation(const Disc& disc, const ShapeTransform& td,
                 const Polyline& poly, const ShapeTransform& tp) {
    const auto pts = worldPoints(poly, tp);
    if (pts.empty()) {
        return std::numeric_limits<float>::max();
    }
    const b2Vec2 centre = toB2(td.translation);
    if (polygonContains(pts, centre)) {
        return -disc.radius;
    }
    const b2ShapeProxy point = pointProxy(centre);
    float best = std::numeric_limits<float>::max();
    forEachEdge(pts, [&](const b2Vec2& a, const b2Vec2& b) {
        best = std::min(best, proxyDistance(point, edgeProxy(a, b)));
    });
    return best - disc.radius;
}

float separation(const Polyline& poly, const ShapeTransform& tp,
                 const Disc& disc, const ShapeTransform& td) {
    return separation(disc, td, poly, tp);
}

float separation(const Polyline& a, const ShapeTransform& ta,
                 const Polyline& b, const ShapeTransform& tb) {
    const auto pa = worldPoints(a, ta);
    const auto pb = worldPoints(b, tb);
    if (pa.empty() || pb.empty()) {
        return std::numeric_limits<float>::max();
    }
    // One contour nested inside the other has no crossing edges.
    if (polygonContains(pb, pa.front()) || polygonContains(pa, pb.front())) {
        return 0.0f;
    }
    float best = std::numeric_limits<float>::max();
    forEachEdge(pa, [&](const b2Vec2& p1, const b2Vec2& p2) {
        const b2ShapeProxy edgeA = edgeProxy(p1, p2);
        forEachEdge(pb, [&](const b2Vec2& q1, const b2Vec2& q2) {
            best = std::min(best, proxyDistance(edgeA, edgeProxy(q1, q2)));
        });
    });
    return best;
}

}  // namespace

float BoundingRadius(const Shape& shape) {
    return std::visit(
        [](const auto& s) -> float {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, Disc>) {
                return s.radius;
            } else {
                float r = 0.0f;
                for (const auto& p : s.points) {
                    r = std::max(r, b2Length(toB2(p)));
                }
                return r;
            }
        },
        shape);
}

std::optional<float> TimeOfImpact(const Shape& shape,
                                  const ShapeTransform& transform,
                                  const Vector2& origin,
                                  const Vector2& direction,
                                  float maxTime,
                                  bool solid) {
    return std::visit(
        [&](const auto& s) { return toi(s, transform, origin, direction, maxTime, solid); },
        shape);
}

bool ContainsPoint(const Shape& shape, const ShapeTransform& transform,
                   const Vector2& point) {
    return TimeOfImpact(shape, transform, point, Vector2{}, 0.0f, true).has_value();
}

Proximity TestProximity(const Shape& a, const ShapeTransform& ta,
                        const Shape& b, const ShapeTransform& tb,
                        float margin) {
    const float gap = std::visit(
        [&](const auto& sa, const auto& sb) { return separation(sa, ta, sb, tb); },
        a, b);
    if (gap <= 0.0f) {
        return Proximity::Intersecting;
    }
    if (gap <= margin) {
        return Proximity::WithinMargin;
    }
    return Proximity::Disjoint;
}

}  // namespace gw::game
