module;

#include <glm/glm.hpp>

export module Geometry:Primitives;

import :MeshBuilder;

export namespace Geometry::Halfedge
{
    // Closed, consistently oriented polygon soups for common solids. Feed them
    // to BuildMesh.

    // p0: apex, p1: bottom left front, p2: bottom right front, p3: bottom rear.
    [[nodiscard]] PolygonSoup TetrahedronSoup(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3);

    // p0: top apex, p1: mid left front, p2: mid right front, p3: mid left back,
    // p4: mid right back, p5: bottom apex.
    [[nodiscard]] PolygonSoup OctahedronSoup(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3, glm::vec3 p4,
                                             glm::vec3 p5);

    // Axis-aligned cube centered at the origin, six outward-facing quads.
    [[nodiscard]] PolygonSoup CubeSoup(float halfExtent = 1.0f);

    // Regular icosahedron inscribed in the unit sphere.
    [[nodiscard]] PolygonSoup IcosahedronSoup();
}
