#include "quality.hpp"

#include <algorithm>

namespace nlm {
namespace {
constexpr double kCodecDelayMs = 10.0;
constexpr double kBaseR = 93.2;
constexpr double kLossWeight = 2.5;
}  // namespace

double r_factor(double avg_latency_ms, double jitter_ms, double loss_pct) {
    double effective = avg_latency_ms + jitter_ms * 2.0 + kCodecDelayMs;
    double latency_penalty =
        effective < 160.0 ? effective / 40.0 : (effective - 120.0) / 10.0;
    double loss_penalty = loss_pct * kLossWeight;
    return std::clamp(kBaseR - latency_penalty - loss_penalty, 0.0, 100.0);
}

double mos_score(double avg_latency_ms, double jitter_ms, double loss_pct) {
    double r = r_factor(avg_latency_ms, jitter_ms, loss_pct);
    double mos = 1.0 + 0.035 * r + r * (r - 60.0) * (100.0 - r) * 7e-6;
    return std::clamp(mos, 1.0, 5.0);
}

QualityGrade grade_for_mos(double mos) {
    if (mos >= 4.3) return QualityGrade::A;
    if (mos >= 4.0) return QualityGrade::B;
    if (mos >= 3.6) return QualityGrade::C;
    if (mos >= 3.1) return QualityGrade::D;
    return QualityGrade::F;
}

const char* grade_letter(QualityGrade g) {
    switch (g) {
        case QualityGrade::A: return "A";
        case QualityGrade::B: return "B";
        case QualityGrade::C: return "C";
        case QualityGrade::D: return "D";
        case QualityGrade::F: return "F";
    }
    return "?";
}

const char* grade_description(QualityGrade g) {
    switch (g) {
        case QualityGrade::A: return "Excellent";
        case QualityGrade::B: return "Good";
        case QualityGrade::C: return "Fair";
        case QualityGrade::D: return "Poor";
        case QualityGrade::F: return "Bad";
    }
    return "?";
}
}  // namespace nlm
