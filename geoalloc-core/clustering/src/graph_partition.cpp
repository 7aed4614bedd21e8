#include <fcntl.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <geoalloc/clustering/graph_partition.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <geoalloc/common/tracy.hpp>
#include <geoalloc/distance/spanning_tree.hpp>
#include <istream>
#include <numeric>
#include <optional>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace geoalloc::clustering {

  namespace {

    constexpr double kMaxEdgeWeight = 1e6;

    // Scratch directory removed when the partition call returns.
    class ScratchDir {
    public:
      explicit ScratchDir(const std::string& base) {
        static std::atomic<unsigned> counter{0};
        const fs::path root = base.empty() ? fs::temp_directory_path() : fs::path(base);
        path_ = root / fmt::format("geoalloc-kahip-{}-{}", ::getpid(), counter.fetch_add(1));
        fs::create_directories(path_);
      }

      ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) logger()->warn("could not remove {}: {}", path_.string(), ec.message());
      }

      ScratchDir(const ScratchDir&) = delete;
      ScratchDir& operator=(const ScratchDir&) = delete;

      [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    private:
      fs::path path_;
    };

  }  // namespace

  // =============================================================================
  // Proximity Graph
  // =============================================================================

  ProximityGraph build_proximity_graph(const distance::DistanceMatrix& matrix, int n_closest) {
    GEOALLOC_ZONE;
    if (n_closest < 1) [[unlikely]] {
      throw ValidationError(fmt::format("n_closest must be positive, got {}", n_closest),
                            "n_closest");
    }

    const size_t n = matrix.size();
    const size_t keep = std::min(static_cast<size_t>(n_closest), n > 0 ? n - 1 : 0);

    std::vector<std::vector<size_t>> adjacency(n);
    std::vector<size_t> candidates;
    for (size_t i = 0; i < n; ++i) {
      candidates.clear();
      for (size_t j = 0; j < n; ++j) {
        if (j != i) candidates.push_back(j);
      }
      std::partial_sort(candidates.begin(), candidates.begin() + keep, candidates.end(),
                        [&](size_t a, size_t b) {
                          if (matrix(i, a) != matrix(i, b)) return matrix(i, a) < matrix(i, b);
                          return a < b;
                        });
      for (size_t r = 0; r < keep; ++r) {
        adjacency[i].push_back(candidates[r]);
        adjacency[candidates[r]].push_back(i);
      }
    }

    double max_w = 0.0;
    for (size_t i = 0; i < n; ++i) {
      auto& nbrs = adjacency[i];
      std::sort(nbrs.begin(), nbrs.end());
      nbrs.erase(std::unique(nbrs.begin(), nbrs.end()), nbrs.end());
      for (size_t j : nbrs) max_w = std::max(max_w, distance::edge_weight(matrix, i, j));
    }

    ProximityGraph graph;
    graph.xadj.reserve(n + 1);
    graph.xadj.push_back(0);
    for (size_t i = 0; i < n; ++i) {
      for (size_t j : adjacency[i]) {
        const double w = distance::edge_weight(matrix, i, j);
        const auto scaled = max_w > 0.0 ? std::llround(w / max_w * kMaxEdgeWeight) : 1LL;
        graph.adjncy.push_back(static_cast<int32_t>(j));
        graph.adjcwgt.push_back(std::max<int64_t>(1, scaled));
      }
      graph.xadj.push_back(static_cast<int64_t>(graph.adjncy.size()));
    }
    return graph;
  }

  void write_metis(std::ostream& out, const ProximityGraph& graph) {
    const size_t n = graph.n_vertices();
    out << n << ' ' << graph.n_edges() << " 1\n";
    for (size_t v = 0; v < n; ++v) {
      for (auto e = graph.xadj[v]; e < graph.xadj[v + 1]; ++e) {
        if (e > graph.xadj[v]) out << ' ';
        out << graph.adjncy[e] + 1 << ' ' << graph.adjcwgt[e];
      }
      out << '\n';
    }
  }

  std::vector<int> read_partition(std::istream& in, size_t n, int k) {
    std::vector<int> labels;
    labels.reserve(n);
    int block = 0;
    while (labels.size() < n && in >> block) {
      if (block < 0 || block >= k) {
        throw PartitionError(n, fmt::format("block {} of vertex {} outside [0, {})", block,
                                            labels.size(), k));
      }
      labels.push_back(block);
    }
    if (labels.size() != n) {
      throw PartitionError(
          n, fmt::format("partition file has {} entries, expected {}", labels.size(), n));
    }
    return labels;
  }

  // =============================================================================
  // Subprocess
  // =============================================================================

  int SubprocessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) [[unlikely]] {
      throw std::invalid_argument("empty command line");
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
      throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
      ::execvp(args[0], args.data());
      ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + WTERMSIG(status);
  }

  // =============================================================================
  // Graph Partitioner
  // =============================================================================

  GraphPartitioner::GraphPartitioner(GraphPartition params, std::shared_ptr<ProcessRunner> runner)
      : params_(std::move(params)), runner_(std::move(runner)) {
    if (params_.n_closest < 1) {
      throw ValidationError(fmt::format("n_closest must be positive, got {}", params_.n_closest),
                            "n_closest");
    }
    if (params_.imbalance < 0.0) {
      throw ValidationError(fmt::format("imbalance must be >= 0, got {}", params_.imbalance),
                            "imbalance");
    }
    if (params_.executable.empty()) {
      throw ValidationError("partitioner executable is empty", "executable");
    }
  }

  std::vector<std::string> GraphPartitioner::command(const fs::path& graph_file,
                                                     const fs::path& output_file, int k,
                                                     uint64_t seed) const {
    std::vector<std::string> argv{
        params_.executable,
        graph_file.string(),
        fmt::format("--k={}", k),
        fmt::format("--seed={}", seed & 0x7fffffffULL),
        fmt::format("--imbalance={:g}", params_.imbalance * 100.0),
        fmt::format("--preconfiguration={}", params_.preconfiguration),
        fmt::format("--output_filename={}", output_file.string()),
    };
    if (params_.balance_edges) argv.emplace_back("--balance_edges");
    return argv;
  }

  ClusterResult GraphPartitioner::partition(std::span<const Point> points,
                                            const distance::DistanceMatrix& matrix, int k,
                                            uint64_t seed) {
    GEOALLOC_ZONE;
    validate_partition_input(points.size(), matrix, k);
    const size_t n = points.size();

    std::vector<int> labels;
    if (k == 1) {
      labels.assign(n, 0);
    } else {
      const auto graph = build_proximity_graph(matrix, params_.n_closest);
      std::optional<ScratchDir> scratch;
      try {
        scratch.emplace(params_.work_dir);
      } catch (const fs::filesystem_error& e) {
        throw PartitionError(n, fmt::format("cannot create scratch directory: {}", e.what()));
      }
      const auto graph_file = scratch->path() / "graph.metis";
      const auto output_file = scratch->path() / "partition.txt";
      {
        std::ofstream out(graph_file);
        if (!out) throw PartitionError(n, "cannot write " + graph_file.string());
        write_metis(out, graph);
        out.flush();
        if (!out) throw PartitionError(n, "cannot write " + graph_file.string());
      }

      const auto argv = command(graph_file, output_file, k, seed);
      logger()->debug("partitioning {} vertices, {} edges into {} blocks: {}", n,
                      graph.n_edges(), k, fmt::join(argv, " "));

      int status = 0;
      try {
        status = runner_->run(argv);
      } catch (const std::system_error& e) {
        throw PartitionError(n, fmt::format("cannot run {}: {}", params_.executable, e.what()));
      }
      if (status != 0) {
        throw PartitionError(
            n, fmt::format("{} exited with status {}", params_.executable, status));
      }

      std::ifstream in(output_file);
      if (!in) throw PartitionError(n, params_.executable + " produced no partition file");
      labels = read_partition(in, n, k);
    }

    ClusterResult result;
    result.clusters = group_labels(points, labels, k);
    result.labels = std::move(labels);
    result.iterations = 1;
    result.converged = true;
    result.method = "kahip";
    return result;
  }

}  // namespace geoalloc::clustering
