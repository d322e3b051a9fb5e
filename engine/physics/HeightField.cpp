#include "engine/physics/HeightField.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace engine::physics
{
namespace
{
constexpr float kVerticalRayEpsilon = 1.0e-6F;
constexpr int kRefineIterations = 12;
} // namespace

HeightField::HeightField(int vertexCountX, int vertexCountZ, float spacing, const glm::vec3& origin)
    : m_vertexCountX(std::max(0, vertexCountX))
    , m_vertexCountZ(std::max(0, vertexCountZ))
    , m_spacing(std::max(0.001F, spacing))
    , m_origin(origin)
{
    m_heights.assign(static_cast<std::size_t>(m_vertexCountX) * static_cast<std::size_t>(m_vertexCountZ), 0.0F);

    const int cellsX = std::max(0, m_vertexCountX - 1);
    const int cellsZ = std::max(0, m_vertexCountZ - 1);
    m_holes.assign(static_cast<std::size_t>(cellsX) * static_cast<std::size_t>(cellsZ), 0U);
}

std::size_t HeightField::VertexIndex(int x, int z) const
{
    return static_cast<std::size_t>(z) * static_cast<std::size_t>(m_vertexCountX) + static_cast<std::size_t>(x);
}

std::size_t HeightField::CellIndex(int cellX, int cellZ) const
{
    return static_cast<std::size_t>(cellZ) * static_cast<std::size_t>(m_vertexCountX - 1) + static_cast<std::size_t>(cellX);
}

void HeightField::SetHeight(int x, int z, float height)
{
    if (x < 0 || z < 0 || x >= m_vertexCountX || z >= m_vertexCountZ)
    {
        return;
    }
    m_heights[VertexIndex(x, z)] = height;
}

float HeightField::Height(int x, int z) const
{
    x = std::clamp(x, 0, std::max(0, m_vertexCountX - 1));
    z = std::clamp(z, 0, std::max(0, m_vertexCountZ - 1));
    if (m_heights.empty())
    {
        return 0.0F;
    }
    return m_heights[VertexIndex(x, z)];
}

void HeightField::SetHole(int cellX, int cellZ, bool hole)
{
    if (Empty() || cellX < 0 || cellZ < 0 || cellX >= m_vertexCountX - 1 || cellZ >= m_vertexCountZ - 1)
    {
        return;
    }
    m_holes[CellIndex(cellX, cellZ)] = hole ? 1U : 0U;
}

bool HeightField::IsHole(int cellX, int cellZ) const
{
    if (Empty() || cellX < 0 || cellZ < 0 || cellX >= m_vertexCountX - 1 || cellZ >= m_vertexCountZ - 1)
    {
        return false;
    }
    return m_holes[CellIndex(cellX, cellZ)] != 0U;
}

void HeightField::CarveHole(float minX, float minZ, float maxX, float maxZ)
{
    if (Empty())
    {
        return;
    }

    const int firstX = static_cast<int>(std::floor((minX - m_origin.x) / m_spacing));
    const int lastX = static_cast<int>(std::ceil((maxX - m_origin.x) / m_spacing)) - 1;
    const int firstZ = static_cast<int>(std::floor((minZ - m_origin.z) / m_spacing));
    const int lastZ = static_cast<int>(std::ceil((maxZ - m_origin.z) / m_spacing)) - 1;

    for (int z = std::max(0, firstZ); z <= std::min(m_vertexCountZ - 2, lastZ); ++z)
    {
        for (int x = std::max(0, firstX); x <= std::min(m_vertexCountX - 2, lastX); ++x)
        {
            SetHole(x, z, true);
        }
    }
}

std::optional<float> HeightField::SampleHeight(float x, float z) const
{
    if (Empty())
    {
        return std::nullopt;
    }

    const float localX = (x - m_origin.x) / m_spacing;
    const float localZ = (z - m_origin.z) / m_spacing;
    const float maxX = static_cast<float>(m_vertexCountX - 1);
    const float maxZ = static_cast<float>(m_vertexCountZ - 1);
    if (localX < 0.0F || localZ < 0.0F || localX > maxX || localZ > maxZ)
    {
        return std::nullopt;
    }

    const int cellX = std::min(static_cast<int>(std::floor(localX)), m_vertexCountX - 2);
    const int cellZ = std::min(static_cast<int>(std::floor(localZ)), m_vertexCountZ - 2);
    if (IsHole(cellX, cellZ))
    {
        return std::nullopt;
    }

    const float fx = localX - static_cast<float>(cellX);
    const float fz = localZ - static_cast<float>(cellZ);

    const float h00 = Height(cellX, cellZ);
    const float h10 = Height(cellX + 1, cellZ);
    const float h01 = Height(cellX, cellZ + 1);
    const float h11 = Height(cellX + 1, cellZ + 1);

    const float nearRow = glm::mix(h00, h10, fx);
    const float farRow = glm::mix(h01, h11, fx);
    return m_origin.y + glm::mix(nearRow, farRow, fz);
}

glm::vec3 HeightField::SampleNormal(float x, float z) const
{
    const float step = m_spacing * 0.5F;
    const std::optional<float> center = SampleHeight(x, z);
    if (!center.has_value())
    {
        return glm::vec3{0.0F, 1.0F, 0.0F};
    }

    const float left = SampleHeight(x - step, z).value_or(*center);
    const float right = SampleHeight(x + step, z).value_or(*center);
    const float back = SampleHeight(x, z - step).value_or(*center);
    const float front = SampleHeight(x, z + step).value_or(*center);

    const glm::vec3 normal{left - right, 2.0F * step, back - front};
    return glm::normalize(normal);
}

std::optional<HeightFieldHit> HeightField::Raycast(const glm::vec3& from, const glm::vec3& to) const
{
    if (Empty())
    {
        return std::nullopt;
    }

    const glm::vec3 delta = to - from;
    const float length = glm::length(delta);
    if (length <= kVerticalRayEpsilon)
    {
        return std::nullopt;
    }

    // Straight-down probes are the common case for placement; solve them exactly.
    if (std::abs(delta.x) <= kVerticalRayEpsilon && std::abs(delta.z) <= kVerticalRayEpsilon)
    {
        const std::optional<float> height = SampleHeight(from.x, from.z);
        if (!height.has_value() || delta.y >= 0.0F)
        {
            return std::nullopt;
        }
        if (from.y < *height || to.y > *height)
        {
            return std::nullopt;
        }

        HeightFieldHit hit;
        hit.t = (from.y - *height) / (from.y - to.y);
        hit.position = glm::vec3{from.x, *height, from.z};
        hit.normal = SampleNormal(from.x, from.z);
        return hit;
    }

    auto heightAbove = [this](const glm::vec3& point) -> std::optional<float> {
        const std::optional<float> height = SampleHeight(point.x, point.z);
        if (!height.has_value())
        {
            return std::nullopt;
        }
        return point.y - *height;
    };

    const float stepLength = m_spacing * 0.25F;
    const int steps = std::max(1, static_cast<int>(std::ceil(length / stepLength)));

    float previousT = 0.0F;
    bool previousAbove = false;
    bool havePrevious = false;
    for (int i = 0; i <= steps; ++i)
    {
        const float t = static_cast<float>(i) / static_cast<float>(steps);
        const std::optional<float> above = heightAbove(from + delta * t);
        if (!above.has_value())
        {
            havePrevious = false;
            continue;
        }

        const bool isAbove = *above > 0.0F;
        if (havePrevious && previousAbove && !isAbove)
        {
            float lo = previousT;
            float hi = t;
            for (int iteration = 0; iteration < kRefineIterations; ++iteration)
            {
                const float mid = 0.5F * (lo + hi);
                const std::optional<float> midAbove = heightAbove(from + delta * mid);
                if (!midAbove.has_value() || *midAbove > 0.0F)
                {
                    lo = mid;
                }
                else
                {
                    hi = mid;
                }
            }

            HeightFieldHit hit;
            hit.t = hi;
            hit.position = from + delta * hi;
            hit.normal = SampleNormal(hit.position.x, hit.position.z);
            return hit;
        }

        previousT = t;
        previousAbove = isAbove;
        havePrevious = true;
    }

    return std::nullopt;
}
} // namespace engine::physics
