#pragma once

namespace nlm {
enum class QualityGrade { A, B, C, D, F };

// Simplified ITU-T G.107 E-model. Effective latency adds twice the jitter
// and a fixed 10 ms codec allowance to the average; the result is the
// transmission rating R in [0, 100].
double r_factor(double avg_latency_ms, double jitter_ms, double loss_pct);

// Mean Opinion Score in [1.0, 5.0] for the given path characteristics.
double mos_score(double avg_latency_ms, double jitter_ms, double loss_pct);

QualityGrade grade_for_mos(double mos);
const char* grade_letter(QualityGrade g);
const char* grade_description(QualityGrade g);
}  // namespace nlm
