#pragma once

#include <optional>
#include <vector>

#include <glm/vec3.hpp>

namespace engine::physics
{
struct HeightFieldHit
{
    float t = 1.0F;
    glm::vec3 position{0.0F};
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
};

/// Regular grid of terrain heights. Vertex (0, 0) sits at origin.xz and heights are
/// relative to origin.y. Cells can be flagged as holes; sampling over a hole or outside
/// the grid yields no height.
class HeightField
{
public:
    HeightField() = default;
    HeightField(int vertexCountX, int vertexCountZ, float spacing, const glm::vec3& origin);

    void SetHeight(int x, int z, float height);
    [[nodiscard]] float Height(int x, int z) const;

    void SetHole(int cellX, int cellZ, bool hole);
    [[nodiscard]] bool IsHole(int cellX, int cellZ) const;

    /// Marks every cell whose footprint overlaps the rectangle [minX, maxX] x [minZ, maxZ].
    void CarveHole(float minX, float minZ, float maxX, float maxZ);

    [[nodiscard]] std::optional<float> SampleHeight(float x, float z) const;
    [[nodiscard]] glm::vec3 SampleNormal(float x, float z) const;

    [[nodiscard]] std::optional<HeightFieldHit> Raycast(const glm::vec3& from, const glm::vec3& to) const;

    [[nodiscard]] bool Empty() const { return m_vertexCountX < 2 || m_vertexCountZ < 2; }

private:
    [[nodiscard]] std::size_t VertexIndex(int x, int z) const;
    [[nodiscard]] std::size_t CellIndex(int cellX, int cellZ) const;

    int m_vertexCountX = 0;
    int m_vertexCountZ = 0;
    float m_spacing = 1.0F;
    glm::vec3 m_origin{0.0F};
    std::vector<float> m_heights;
    std::vector<unsigned char> m_holes;
};
} // namespace engine::physics
