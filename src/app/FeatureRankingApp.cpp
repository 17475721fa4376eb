#include "app/FeatureRankingApp.hpp"
#include "functions/io/DataIO.hpp"
#include "finder/MinEntropyFeatureFinder.hpp"
#include "criterion/EntropyCriterion.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#ifdef _OPENMP
#include <omp.h>
#endif

void runFeatureRankingApp(const ProgramOptions& opts) {
    auto totalStart = std::chrono::high_resolution_clock::now();

    // 1. 读取数据并拆出标签列
    id3::DataIO io;
    id3::CategoricalTable table = io.readCategoricalCSV(opts.dataPath);
    id3::LabelVector label = id3::DataIO::splitLabel(table, opts.labelColumn);

    std::cout << "Label: " << label.name << " | Features: " << table.columnCount();
    if (table.hasColumn(id3::MinEntropyFeatureFinder::kIndexColumn)) {
        std::cout << " (including '" << id3::MinEntropyFeatureFinder::kIndexColumn
                  << "', ignored)";
    }
    std::cout << std::endl;

    #ifdef _OPENMP
    std::cout << "Using up to " << omp_get_max_threads()
              << " OpenMP threads (controlled by OMP_NUM_THREADS)" << std::endl;
    #endif

    // 2. 特征排序
    auto rankStart = std::chrono::high_resolution_clock::now();
    id3::MinEntropyFeatureFinder finder;
    const id3::EntropyCriterion  criterion{};
    const auto ranking = finder.rankFeatures(table, label, criterion);
    auto rankEnd = std::chrono::high_resolution_clock::now();

    // 3. 输出结果
    if (opts.showRanking) {
        std::cout << "\n=== Feature Ranking (ascending conditional entropy) ===" << std::endl;
        std::cout << std::left << std::setw(24) << "Feature"
                  << std::right << std::setw(12) << "Entropy"
                  << std::setw(12) << "Gain" << std::endl;
        std::cout << std::fixed << std::setprecision(6);
        for (const auto& s : ranking) {
            std::cout << std::left << std::setw(24) << s.name
                      << std::right << std::setw(12) << s.entropy
                      << std::setw(12) << s.gain << std::endl;
        }
        std::cout << std::defaultfloat;
    }

    const auto& best = ranking.front();
    std::cout << "\nBest feature: " << best.name
              << " | Entropy: " << std::fixed << std::setprecision(6) << best.entropy
              << " | Gain: " << best.gain << std::defaultfloat << std::endl;

    auto totalEnd = std::chrono::high_resolution_clock::now();
    auto rankTime  = std::chrono::duration_cast<std::chrono::milliseconds>(rankEnd - rankStart);
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);
    std::cout << "Rank time: " << rankTime.count() << "ms"
              << " | Total: " << totalTime.count() << "ms" << std::endl;
}
