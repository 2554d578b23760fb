#include "pathlayer/solvers/Maximizers.h"
#include "pathlayer/core/GridGraph.h"
#include "pathlayer/solvers/ShortestPath.h"

namespace pathlayer {

PathMatrix dijkstraMaximizer(const CostMatrix& theta, const MaximizerContext& context) {
    GridGraph graph(-theta, context.connectivity);
    VertexPath path = algorithms::dijkstraShortestPath(graph, graph.source(), graph.destination());
    return algorithms::pathToMatrix(graph, path);
}

PathMatrix bellmanMaximizer(const CostMatrix& theta, const MaximizerContext& context) {
    GridGraph graph(-theta, context.connectivity);
    VertexPath path = algorithms::boundedBellmanFord(graph, graph.source(), graph.destination(),
                                                     context.lengthMax);
    return algorithms::pathToMatrix(graph, path);
}

}  // namespace pathlayer
