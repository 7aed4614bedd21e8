#pragma once
#include <cstdint>
#include <filesystem>
#include <geoalloc/clustering/cluster.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace geoalloc::clustering {

  // Undirected graph in compressed sparse row form, vertices 0-based.
  struct ProximityGraph {
    std::vector<int64_t> xadj;
    std::vector<int32_t> adjncy;
    std::vector<int64_t> adjcwgt;

    [[nodiscard]] size_t n_vertices() const noexcept {
      return xadj.empty() ? 0 : xadj.size() - 1;
    }
    [[nodiscard]] size_t n_edges() const noexcept { return adjncy.size() / 2; }
  };

  // Connects every point to its n_closest nearest neighbours (ties to the
  // smaller index) and symmetrises. Edge weight is the distance scaled to
  // integers in [1, 1e6].
  [[nodiscard]] ProximityGraph build_proximity_graph(const distance::DistanceMatrix& matrix,
                                                     int n_closest);

  // METIS graph format, edge weights only.
  void write_metis(std::ostream& out, const ProximityGraph& graph);

  // One block id per line; throws PartitionError on short, malformed or out-of-range input.
  [[nodiscard]] std::vector<int> read_partition(std::istream& in, size_t n, int k);

  // Runs an external command and returns its exit status.
  class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;
    [[nodiscard]] virtual int run(const std::vector<std::string>& argv) = 0;
  };

  // fork/execvp with the child's stdout and stderr sent to /dev/null. An
  // executable that cannot be started exits with 127.
  class SubprocessRunner : public ProcessRunner {
  public:
    [[nodiscard]] int run(const std::vector<std::string>& argv) override;
  };

  class GraphPartitioner : public IPartitioner {
  public:
    GraphPartitioner(GraphPartition params, std::shared_ptr<ProcessRunner> runner);

    [[nodiscard]] ClusterResult partition(std::span<const Point> points,
                                          const distance::DistanceMatrix& matrix, int k,
                                          uint64_t seed) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "kahip"; }

    // Command line for one kaffpa run.
    [[nodiscard]] std::vector<std::string> command(const std::filesystem::path& graph_file,
                                                   const std::filesystem::path& output_file,
                                                   int k, uint64_t seed) const;

  private:
    GraphPartition params_;
    std::shared_ptr<ProcessRunner> runner_;
  };

}  // namespace geoalloc::clustering
