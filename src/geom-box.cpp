/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of mpring.
 *
 * Copyright (C) 2024-2026 by the mpring developer community.
 * For a full list of authors see the git log.
 */

#include "geom-box.hpp"

namespace geom {

box_t &box_t::extend(point_t const &point) noexcept
{
    if (point.x() < m_min_x) {
        m_min_x = point.x();
    }
    if (point.y() < m_min_y) {
        m_min_y = point.y();
    }
    if (point.x() > m_max_x) {
        m_max_x = point.x();
    }
    if (point.y() > m_max_y) {
        m_max_y = point.y();
    }

    return *this;
}

void box_t::extend(point_list_t const &list) noexcept
{
    for (auto const &point : list) {
        extend(point);
    }
}

void box_t::extend(box_t const &box) noexcept
{
    if (!box.valid()) {
        return;
    }

    extend(point_t{box.min_x(), box.min_y()});
    extend(point_t{box.max_x(), box.max_y()});
}

bool box_t::contains(box_t const &other) const noexcept
{
    if (empty() || other.empty()) {
        return false;
    }

    return other.min_x() >= m_min_x && other.min_y() >= m_min_y &&
           other.max_x() <= m_max_x && other.max_y() <= m_max_y;
}

bool box_t::intersects(box_t const &other) const noexcept
{
    if (empty() || other.empty()) {
        return false;
    }

    return other.max_x() > m_min_x && other.max_y() > m_min_y &&
           other.min_x() < m_max_x && other.min_y() < m_max_y;
}

} // namespace geom
