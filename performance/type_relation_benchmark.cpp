/*
 * type_relation_benchmark.cpp
 *
 *  Times subtype queries over a deep, diamond-rich hierarchy.
 */

#include <iostream>
#include <chrono>
#include <string>
#include <vector>
#include "../headers/facetCore.h"

using namespace facet;

void benchmarks(TypeSpace& space)
{
    const int num_layers = 40;
    const int layer_width = 4;
    const int num_queries = 20000;
    std::cout << "--- Type Relation Benchmark ---" << std::endl;
    std::cout << "Layers: " << num_layers << ", Width: " << layer_width << ", Queries: " << num_queries << std::endl;

    // --- Build Hierarchy ---
    // Every type descends from two types of the previous layer
    auto start_build = std::chrono::high_resolution_clock::now();
    std::vector<std::vector<const TypeDescriptor*>> layers(num_layers);
    layers[0].push_back(space.newType("root"));
    for (int layer = 1; layer < num_layers; ++layer) {
        const std::vector<const TypeDescriptor*>& above = layers[layer - 1];
        for (int i = 0; i < layer_width; ++i) {
            std::vector<const TypeDescriptor*> parents{above[i % above.size()], above[(i + 1) % above.size()]};
            layers[layer].push_back(space.newType("t" + std::to_string(layer) + "_" + std::to_string(i), parents));
        }
    }
    auto end_build = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff_build = end_build - start_build;

    // --- Query ---
    const TypeDescriptor* root = layers[0][0];
    const TypeDescriptor* unrelated = space.newType("unrelated");
    auto start_query = std::chrono::high_resolution_clock::now();
    long long hits = 0;
    for (int q = 0; q < num_queries; ++q) {
        const TypeDescriptor* leaf = layers[num_layers - 1][q % layer_width];
        if (root->is(leaf))
            ++hits;
        if (unrelated->is(leaf))
            ++hits;
        if (leaf->is(root))
            ++hits;
    }
    auto end_query = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff_query = end_query - start_query;

    // --- Verification ---
    if (hits != num_queries) {
        std::cerr << "Checksum mismatch! Got " << hits << ", expected " << num_queries << std::endl;
    } else {
        std::cout << "Checksum verified." << std::endl;
    }

    std::cout << "Declared types: " << space.getSize() << std::endl;
    std::cout << "Build time: " << diff_build.count() << " s" << std::endl;
    std::cout << "Total query time: " << diff_query.count() << " s" << std::endl;
    std::cout << "-------------------------------" << std::endl;
}

int main(int argc, char* argv[]) {
    facet::TypeSpace space;
    benchmarks(space);
    return 0;
}
