#include "app/FeatureRankingApp.hpp"
#include <iostream>
#include <exception>
#include <string>

int main(int argc, char** argv) {
    // 1. 设定默认参数
    ProgramOptions opts;
    opts.dataPath    = "../data/play_tennis.csv";
    opts.labelColumn = "";           // 默认最后一列
    opts.showRanking = true;

    // 2. 参数解析
    if (argc >= 2) opts.dataPath = argv[1];
    if (argc >= 3) opts.labelColumn = argv[2];
    if (argc >= 4) opts.showRanking = (std::string(argv[3]) != "0");

    // 3. 输出参数
    std::cout << "Data: " << opts.dataPath << " | ";
    std::cout << "Label: " << (opts.labelColumn.empty() ? "<last column>" : opts.labelColumn) << " | ";
    std::cout << "Ranking: " << (opts.showRanking ? "on" : "off") << std::endl;

    // 4. 运行
    try {
        runFeatureRankingApp(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
