#pragma once
#include <cstddef>
#include <vector>

namespace nlm {
// Merging t-digest: a bounded set of weighted centroids approximating the
// distribution of an unbounded stream. Centroids stay small near the tails
// and grow toward the median, so extreme quantiles keep the most precision.
class TDigest {
   public:
    explicit TDigest(size_t max_centroids = 100);

    // Folds a batch of raw samples into the digest. Cost is linear in the
    // batch plus the current centroid count, so callers should batch.
    void merge_unsorted(std::vector<double> values);

    // q in [0, 1]. Returns 0 for an empty digest.
    double quantile(double q) const;

    double count() const {
        return count_;
    }
    bool empty() const {
        return centroids_.empty();
    }
    size_t centroid_count() const {
        return centroids_.size();
    }
    size_t max_centroids() const {
        return max_size_;
    }
    double min() const {
        return min_;
    }
    double max() const {
        return max_;
    }
    void clear();

   private:
    struct Centroid {
        double mean;
        double weight;
    };

    // Cumulative-quantile limit for the k-th centroid of a d-centroid digest.
    static double k_to_q(double k, double d);

    size_t max_size_;
    std::vector<Centroid> centroids_;
    double count_{0};
    double min_{0};
    double max_{0};
};
}  // namespace nlm
