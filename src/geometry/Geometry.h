#pragma once

#include <QMetaType>
#include <QString>
#include <QVector>

struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vector3 operator+(const Vector3& other) const { return {x + other.x, y + other.y, z + other.z}; }
    Vector3 operator-(const Vector3& other) const { return {x - other.x, y - other.y, z - other.z}; }
    Vector3 operator*(double scalar) const { return {x * scalar, y * scalar, z * scalar}; }
    Vector3 operator/(double scalar) const { return *this * (1.0 / scalar); }
    Vector3& operator+=(const Vector3& other);

    bool operator==(const Vector3& other) const { return x == other.x && y == other.y && z == other.z; }
    bool operator!=(const Vector3& other) const { return !(*this == other); }

    double lengthSquared() const { return x * x + y * y + z * z; }
    double length() const;
    // Zero vector stays zero.
    Vector3 normalize() const;
    Vector3 round() const;

    // Serialized as "x,y,z" with enough digits to reconstruct every component exactly.
    QString toString() const;
    static Vector3 fromString(const QString& text, bool* ok = nullptr);

    static Vector3 min(const Vector3& a, const Vector3& b);
    static Vector3 max(const Vector3& a, const Vector3& b);
    static Vector3 unit() { return {1.0, 1.0, 1.0}; }
};

Q_DECLARE_METATYPE(Vector3)

struct Line3 {
    Vector3 a;
    Vector3 b;

    Vector3 vector() const { return b - a; }
    Vector3 fullMin() const { return Vector3::min(a, b); }
    Vector3 fullMax() const { return Vector3::max(a, b); }
    double distance() const { return (a - b).length(); }
    double distanceSquared() const { return (a - b).lengthSquared(); }

    /**
     * Strict intersection of the XY projections of two segments.
     * Parallel segments and segments that only touch at an endpoint do not intersect.
     */
    bool intersects2(const Line3& other) const;
};

struct Box3 {
    Vector3 a;
    Vector3 b;

    static Box3 fromRadius(const Vector3& center, double radius);

    Box3 expanded(double distance) const;
    // Inclusive on every axis; corner order does not matter.
    bool contains(const Vector3& point) const;
    Line3 line() const { return Line3{a, b}; }
};

class Path {
public:
    explicit Path(const Vector3& origin = Vector3());

    const Vector3& origin() const { return m_origin; }
    const QVector<Line3>& lines() const { return m_lines; }

    void next(const Vector3& point);
    Path withBisectedLines(double radius) const;
    QVector<Vector3> vertices() const;
    Vector3 lastVertex() const;
    Vector3 getCenter() const;
    double getRadius() const;

private:
    Vector3 m_origin;
    Vector3 m_at;
    // Relative to m_origin.
    QVector<Line3> m_lines;
};
