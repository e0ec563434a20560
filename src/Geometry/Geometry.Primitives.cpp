module;

#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

module Geometry:Primitives.Impl;

import :MeshBuilder;
import :Primitives;

namespace Geometry::Halfedge
{
    PolygonSoup TetrahedronSoup(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3)
    {
        PolygonSoup soup;
        soup.Positions = {p0, p1, p2, p3};
        soup.Faces = {{0, 1, 2}, {1, 0, 3}, {2, 3, 0}, {3, 2, 1}};
        return soup;
    }

    PolygonSoup OctahedronSoup(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2, glm::vec3 p3, glm::vec3 p4, glm::vec3 p5)
    {
        PolygonSoup soup;
        soup.Positions = {p0, p1, p2, p3, p4, p5};
        soup.Faces = {
            {0, 1, 2}, {0, 3, 1}, {0, 2, 4}, {0, 4, 3},
            {5, 2, 1}, {5, 1, 3}, {5, 4, 2}, {5, 3, 4},
        };
        return soup;
    }

    PolygonSoup CubeSoup(float halfExtent)
    {
        PolygonSoup soup;
        soup.Positions.reserve(8);

        // Corner i has x from bit 0, y from bit 1, z from bit 2.
        for (std::uint32_t i = 0; i < 8; ++i)
        {
            soup.Positions.emplace_back((i & 1u) ? halfExtent : -halfExtent,
                                        (i & 2u) ? halfExtent : -halfExtent,
                                        (i & 4u) ? halfExtent : -halfExtent);
        }

        soup.Faces = {
            {0, 2, 3, 1}, // -z
            {4, 5, 7, 6}, // +z
            {0, 1, 5, 4}, // -y
            {2, 6, 7, 3}, // +y
            {0, 4, 6, 2}, // -x
            {1, 3, 7, 5}, // +x
        };
        return soup;
    }

    PolygonSoup IcosahedronSoup()
    {
        const float phi = (1.0f + std::sqrt(5.0f)) / 2.0f;
        const float scale = 1.0f / std::sqrt(1.0f + phi * phi);

        PolygonSoup soup;
        soup.Positions = {
            glm::vec3(0, 1, phi) * scale,   glm::vec3(0, -1, phi) * scale,
            glm::vec3(0, 1, -phi) * scale,  glm::vec3(0, -1, -phi) * scale,
            glm::vec3(1, phi, 0) * scale,   glm::vec3(-1, phi, 0) * scale,
            glm::vec3(1, -phi, 0) * scale,  glm::vec3(-1, -phi, 0) * scale,
            glm::vec3(phi, 0, 1) * scale,   glm::vec3(-phi, 0, 1) * scale,
            glm::vec3(phi, 0, -1) * scale,  glm::vec3(-phi, 0, -1) * scale,
        };

        soup.Faces = {
            {0, 1, 8},  {0, 8, 4},  {0, 4, 5},  {0, 5, 9},  {0, 9, 1},
            {1, 6, 8},  {1, 7, 6},  {1, 9, 7},  {2, 3, 11}, {2, 10, 3},
            {2, 4, 10}, {2, 5, 4},  {2, 11, 5}, {3, 6, 7},  {3, 10, 6},
            {3, 7, 11}, {4, 8, 10}, {5, 11, 9}, {6, 10, 8}, {7, 9, 11},
        };
        return soup;
    }
}
