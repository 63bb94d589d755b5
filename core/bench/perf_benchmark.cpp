#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Geometry>

#include "rigid/core/math/rigid_transform.hpp"
#include "rigid/core/math/types.hpp"

using rigid::core::ColumnMajorMatrix;
using rigid::core::Isometry;
using rigid::core::Quat;
using rigid::core::RigidTransform;
using rigid::core::Vec3;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// Deterministic chain of poses; the benchmark composes neighbours.
static std::vector<RigidTransform> makeBenchPoses(int count) {
  std::vector<RigidTransform> poses;
  poses.reserve(count);
  for (int i = 0; i < count; ++i) {
    const double t = 0.01 * static_cast<double>(i);
    const Vec3 axis = Vec3(std::sin(t), std::cos(2.0 * t), 0.5).normalized();
    const Quat q(Eigen::AngleAxisd(0.3 + t, axis));
    poses.emplace_back(Vec3(std::cos(t), std::sin(t), 0.1 * t), q);
  }
  return poses;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: rigid_core_perf_benchmark [--iters=N] [--poses=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int iters = parseIntArg(argc, argv, "--iters", 200000);
  const int pose_count = std::max(2, parseIntArg(argc, argv, "--poses", 256));
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  const std::vector<RigidTransform> poses = makeBenchPoses(pose_count);
  std::vector<Isometry> isometries;
  isometries.reserve(poses.size());
  for (const RigidTransform& T : poses) {
    isometries.push_back(T.isometry());
  }

  double acc = 0.0;
  const Vec3 point(0.3, -0.2, 0.7);

  auto run_compose = [&](bool baseline) {
    for (int i = 0; i < iters; ++i) {
      const std::size_t a = static_cast<std::size_t>(i) % poses.size();
      const std::size_t b = (a + 1) % poses.size();
      if (baseline) {
        const Isometry T = isometries[a] * isometries[b].inverse();
        acc += (T * point).x();
      } else {
        const RigidTransform T = poses[a] * poses[b].inverse();
        acc += T.apply(point).x();
      }
    }
  };

  auto run_interpolate = [&]() {
    for (int i = 0; i < iters; ++i) {
      const std::size_t a = static_cast<std::size_t>(i) % poses.size();
      const std::size_t b = (a + 1) % poses.size();
      const double f = static_cast<double>(i % 101) / 100.0;
      acc += RigidTransform::interpolate(poses[a], poses[b], f).orientation().w();
    }
  };

  auto run_interchange = [&]() {
    RigidTransform T;
    for (int i = 0; i < iters; ++i) {
      const std::size_t a = static_cast<std::size_t>(i) % poses.size();
      const ColumnMajorMatrix m = poses[a].toColumnMajorMatrix();
      T.setFromColumnMajorMatrix(m);
      acc += T.position().z();
    }
  };

  std::vector<double> compose_runs;
  std::vector<double> compose_base_runs;
  std::vector<double> interp_runs;
  std::vector<double> interchange_runs;
  compose_runs.reserve(trials);
  compose_base_runs.reserve(trials);
  interp_runs.reserve(trials);
  interchange_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_compose(false);
    run_compose(true);
    run_interpolate();
    run_interchange();
  }

  for (int i = 0; i < trials; ++i) {
    compose_runs.push_back(benchMs([&]() { run_compose(false); }));
    compose_base_runs.push_back(benchMs([&]() { run_compose(true); }));
    interp_runs.push_back(benchMs([&]() { run_interpolate(); }));
    interchange_runs.push_back(benchMs([&]() { run_interchange(); }));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double compose_ms = median(compose_runs);
  const double compose_base_ms = median(compose_base_runs);
  const double interp_ms = median(interp_runs);
  const double interchange_ms = median(interchange_runs);

  std::cout << "rigid_core_perf_benchmark\n";
  std::cout << "  poses: " << pose_count << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  compose+inverse+apply: " << compose_ms << " ms total, "
            << (compose_ms * 1e6 / iters) << " ns/call\n";
  std::cout << "  compose+inverse+apply (Isometry3d): " << compose_base_ms << " ms total, "
            << (compose_base_ms * 1e6 / iters) << " ns/call\n";
  std::cout << "  interpolate: " << interp_ms << " ms total, "
            << (interp_ms * 1e6 / iters) << " ns/call\n";
  std::cout << "  column-major export+import: " << interchange_ms << " ms total, "
            << (interchange_ms * 1e6 / iters) << " ns/call\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
