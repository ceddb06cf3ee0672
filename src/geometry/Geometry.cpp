#include "Geometry.h"

#include <QStringList>

#include <algorithm>
#include <cmath>

Vector3& Vector3::operator+=(const Vector3& other) {
    x += other.x;
    y += other.y;
    z += other.z;
    return *this;
}

double Vector3::length() const {
    return std::sqrt(lengthSquared());
}

Vector3 Vector3::normalize() const {
    const double len = length();
    return len == 0.0 ? Vector3() : *this / len;
}

Vector3 Vector3::round() const {
    return {std::floor(x + 0.5), std::floor(y + 0.5), std::floor(z + 0.5)};
}

QString Vector3::toString() const {
    return QStringLiteral("%1,%2,%3")
        .arg(QString::number(x, 'g', 17), QString::number(y, 'g', 17), QString::number(z, 'g', 17));
}

Vector3 Vector3::fromString(const QString& text, bool* ok) {
    if (ok) {
        *ok = false;
    }
    const QStringList parts = text.split(QLatin1Char(','));
    if (parts.size() != 3) {
        return Vector3();
    }

    double values[3] = {0.0, 0.0, 0.0};
    for (int i = 0; i < 3; ++i) {
        bool partOk = false;
        values[i] = parts[i].trimmed().toDouble(&partOk);
        if (!partOk) {
            return Vector3();
        }
    }

    if (ok) {
        *ok = true;
    }
    return {values[0], values[1], values[2]};
}

Vector3 Vector3::min(const Vector3& a, const Vector3& b) {
    return {std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)};
}

Vector3 Vector3::max(const Vector3& a, const Vector3& b) {
    return {std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
}

bool Line3::intersects2(const Line3& other) const {
    const Vector3& p = a;
    const Vector3& q = b;
    const Vector3& r = other.a;
    const Vector3& s = other.b;

    const double det = (q.x - p.x) * (s.y - r.y) - (s.x - r.x) * (q.y - p.y);
    if (det == 0.0) {
        return false;
    }

    const double lambda = ((s.y - r.y) * (s.x - p.x) + (r.x - s.x) * (s.y - p.y)) / det;
    const double gamma = ((p.y - q.y) * (s.x - p.x) + (q.x - p.x) * (s.y - p.y)) / det;
    return (0.0 < lambda && lambda < 1.0) && (0.0 < gamma && gamma < 1.0);
}

Box3 Box3::fromRadius(const Vector3& center, double radius) {
    const Vector3 radiusVector = Vector3::unit() * radius;
    return Box3{center - radiusVector, center + radiusVector};
}

Box3 Box3::expanded(double distance) const {
    const Vector3 offset = Vector3::unit() * distance;
    return Box3{Vector3::min(a, b) - offset, Vector3::max(a, b) + offset};
}

bool Box3::contains(const Vector3& point) const {
    const Vector3 lo = Vector3::min(a, b);
    const Vector3 hi = Vector3::max(a, b);
    return point.x >= lo.x && point.x <= hi.x && point.y >= lo.y && point.y <= hi.y && point.z >= lo.z &&
           point.z <= hi.z;
}

Path::Path(const Vector3& origin)
    : m_origin(origin) {}

void Path::next(const Vector3& point) {
    const Vector3 relative = point - m_origin;
    if ((m_at - relative).lengthSquared() > 0.0) {
        m_lines.push_back(Line3{m_at, relative});
        m_at = relative;
    }
}

Path Path::withBisectedLines(double radius) const {
    Path path(m_origin);
    path.m_at = m_at;
    if (radius <= 0.0) {
        path.m_lines = m_lines;
        return path;
    }

    QVector<Line3> pending;
    for (auto it = m_lines.crbegin(); it != m_lines.crend(); ++it) {
        pending.push_back(*it);
    }
    while (!pending.isEmpty()) {
        const Line3 line = pending.takeLast();
        if (line.distance() >= radius) {
            const Vector3 middle = (line.a + line.b) / 2.0;
            pending.push_back(Line3{middle, line.b});
            pending.push_back(Line3{line.a, middle});
        } else {
            path.m_lines.push_back(line);
        }
    }
    return path;
}

QVector<Vector3> Path::vertices() const {
    QVector<Vector3> result;
    result.reserve(m_lines.size() + 1);
    result.push_back(m_origin);
    for (const Line3& line : m_lines) {
        result.push_back(line.b + m_origin);
    }
    return result;
}

Vector3 Path::lastVertex() const {
    if (m_lines.isEmpty()) {
        return m_origin;
    }
    return m_lines.last().b + m_origin;
}

Vector3 Path::getCenter() const {
    const QVector<Vector3> points = vertices();
    Vector3 sum;
    for (const Vector3& point : points) {
        sum += point;
    }
    return sum / static_cast<double>(points.size());
}

double Path::getRadius() const {
    const Vector3 center = getCenter();
    Vector3 furthest = center;
    for (const Vector3& point : vertices()) {
        if ((point - center).lengthSquared() >= (furthest - center).lengthSquared()) {
            furthest = point;
        }
    }
    return (furthest - center).length();
}
