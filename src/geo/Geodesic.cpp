#include "geo/Geodesic.hpp"
#include <cmath>
#include <numbers>

namespace efb::geo::geodesic {

namespace {
    constexpr int MAX_ITERATIONS = 200;
    constexpr double EPSILON = 1e-12;
    constexpr double MEAN_EARTH_RADIUS = 6371008.8;

    constexpr double toRadians(double degrees) {
        return degrees * std::numbers::pi / 180.0;
    }

    constexpr double toDegrees(double radians) {
        return radians * 180.0 / std::numbers::pi;
    }

    double normalizeBearing(double degrees) {
        double d = std::fmod(degrees, 360.0);
        if (d < 0.0) {
            d += 360.0;
        }
        return d >= 360.0 ? 0.0 : d;
    }

    double normalizeLongitude(double degrees) {
        double d = std::fmod(degrees + 180.0, 360.0);
        if (d < 0.0) {
            d += 360.0;
        }
        return d - 180.0;
    }

    // 球面初始方位
    double sphericalBearing(const Coordinate& from, const Coordinate& to) {
        const double lat1 = toRadians(from.latitude);
        const double lat2 = toRadians(to.latitude);
        const double deltaLon = toRadians(to.longitude - from.longitude);
        const double y = std::sin(deltaLon) * std::cos(lat2);
        const double x = std::cos(lat1) * std::sin(lat2) -
                         std::sin(lat1) * std::cos(lat2) * std::cos(deltaLon);
        return normalizeBearing(toDegrees(std::atan2(y, x)));
    }
}

double haversineMeters(const Coordinate& from, const Coordinate& to) noexcept {
    const double lat1 = toRadians(from.latitude);
    const double lat2 = toRadians(to.latitude);
    const double deltaLat = toRadians(to.latitude - from.latitude);
    const double deltaLon = toRadians(to.longitude - from.longitude);

    const double a = std::sin(deltaLat / 2) * std::sin(deltaLat / 2) +
                     std::cos(lat1) * std::cos(lat2) *
                     std::sin(deltaLon / 2) * std::sin(deltaLon / 2);

    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return MEAN_EARTH_RADIUS * c;
}

Inverse inverse(const Coordinate& from, const Coordinate& to) noexcept {
    const double L = toRadians(to.longitude - from.longitude);
    const double U1 = std::atan((1.0 - WGS84_F) * std::tan(toRadians(from.latitude)));
    const double U2 = std::atan((1.0 - WGS84_F) * std::tan(toRadians(to.latitude)));
    const double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
    const double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

    double lambda = L;
    double sinLambda = 0.0, cosLambda = 0.0;
    double sinSigma = 0.0, cosSigma = 0.0, sigma = 0.0;
    double cosSqAlpha = 0.0, cos2SigmaM = 0.0;
    bool converged = false;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        sinLambda = std::sin(lambda);
        cosLambda = std::cos(lambda);
        const double t1 = cosU2 * sinLambda;
        const double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cosLambda;
        sinSigma = std::sqrt(t1 * t1 + t2 * t2);
        if (sinSigma == 0.0) {
            // 重合点
            return Inverse{};
        }
        cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
        sigma = std::atan2(sinSigma, cosSigma);
        const double sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
        cosSqAlpha = 1.0 - sinAlpha * sinAlpha;
        cos2SigmaM = cosSqAlpha != 0.0 ? cosSigma - 2.0 * sinU1 * sinU2 / cosSqAlpha : 0.0;
        const double C = WGS84_F / 16.0 * cosSqAlpha * (4.0 + WGS84_F * (4.0 - 3.0 * cosSqAlpha));
        const double lambdaPrev = lambda;
        lambda = L + (1.0 - C) * WGS84_F * sinAlpha *
                 (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM)));
        if (std::abs(lambda - lambdaPrev) < EPSILON) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        const double bearing = sphericalBearing(from, to);
        return Inverse{haversineMeters(from, to), bearing, normalizeBearing(sphericalBearing(to, from) + 180.0)};
    }

    const double uSq = cosSqAlpha * (WGS84_A * WGS84_A - WGS84_B * WGS84_B) / (WGS84_B * WGS84_B);
    const double A = 1.0 + uSq / 16384.0 * (4096.0 + uSq * (-768.0 + uSq * (320.0 - 175.0 * uSq)));
    const double B = uSq / 1024.0 * (256.0 + uSq * (-128.0 + uSq * (74.0 - 47.0 * uSq)));
    const double deltaSigma = B * sinSigma *
        (cos2SigmaM + B / 4.0 *
            (cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM) -
             B / 6.0 * cos2SigmaM * (-3.0 + 4.0 * sinSigma * sinSigma) *
                 (-3.0 + 4.0 * cos2SigmaM * cos2SigmaM)));

    Inverse result;
    result.distance = WGS84_B * A * (sigma - deltaSigma);
    result.initialBearing = normalizeBearing(toDegrees(
        std::atan2(cosU2 * sinLambda, cosU1 * sinU2 - sinU1 * cosU2 * cosLambda)));
    result.finalBearing = normalizeBearing(toDegrees(
        std::atan2(cosU1 * sinLambda, -sinU1 * cosU2 + cosU1 * sinU2 * cosLambda)));
    return result;
}

Coordinate direct(const Coordinate& from, double bearingDegrees, double distanceMeters) noexcept {
    if (distanceMeters == 0.0) {
        return from;
    }

    const double alpha1 = toRadians(bearingDegrees);
    const double sinAlpha1 = std::sin(alpha1);
    const double cosAlpha1 = std::cos(alpha1);

    const double tanU1 = (1.0 - WGS84_F) * std::tan(toRadians(from.latitude));
    const double cosU1 = 1.0 / std::sqrt(1.0 + tanU1 * tanU1);
    const double sinU1 = tanU1 * cosU1;
    const double sigma1 = std::atan2(tanU1, cosAlpha1);
    const double sinAlpha = cosU1 * sinAlpha1;
    const double cosSqAlpha = 1.0 - sinAlpha * sinAlpha;
    const double uSq = cosSqAlpha * (WGS84_A * WGS84_A - WGS84_B * WGS84_B) / (WGS84_B * WGS84_B);
    const double A = 1.0 + uSq / 16384.0 * (4096.0 + uSq * (-768.0 + uSq * (320.0 - 175.0 * uSq)));
    const double B = uSq / 1024.0 * (256.0 + uSq * (-128.0 + uSq * (74.0 - 47.0 * uSq)));

    double sigma = distanceMeters / (WGS84_B * A);
    double sinSigma = 0.0, cosSigma = 0.0, cos2SigmaM = 0.0;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        cos2SigmaM = std::cos(2.0 * sigma1 + sigma);
        sinSigma = std::sin(sigma);
        cosSigma = std::cos(sigma);
        const double deltaSigma = B * sinSigma *
            (cos2SigmaM + B / 4.0 *
                (cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM) -
                 B / 6.0 * cos2SigmaM * (-3.0 + 4.0 * sinSigma * sinSigma) *
                     (-3.0 + 4.0 * cos2SigmaM * cos2SigmaM)));
        const double sigmaPrev = sigma;
        sigma = distanceMeters / (WGS84_B * A) + deltaSigma;
        if (std::abs(sigma - sigmaPrev) < EPSILON) {
            break;
        }
    }

    sinSigma = std::sin(sigma);
    cosSigma = std::cos(sigma);
    cos2SigmaM = std::cos(2.0 * sigma1 + sigma);

    const double tmp = sinU1 * sinSigma - cosU1 * cosSigma * cosAlpha1;
    const double lat2 = std::atan2(sinU1 * cosSigma + cosU1 * sinSigma * cosAlpha1,
                                   (1.0 - WGS84_F) * std::sqrt(sinAlpha * sinAlpha + tmp * tmp));
    const double lambda = std::atan2(sinSigma * sinAlpha1,
                                     cosU1 * cosSigma - sinU1 * sinSigma * cosAlpha1);
    const double C = WGS84_F / 16.0 * cosSqAlpha * (4.0 + WGS84_F * (4.0 - 3.0 * cosSqAlpha));
    const double L = lambda - (1.0 - C) * WGS84_F * sinAlpha *
        (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM)));

    return Coordinate{toDegrees(lat2), normalizeLongitude(from.longitude + toDegrees(L))};
}

} // namespace efb::geo::geodesic
