#ifndef APP_FEATURE_RANKING_APP_HPP
#define APP_FEATURE_RANKING_APP_HPP
#include <string>

/** 运行参数 */
struct ProgramOptions {
    std::string dataPath;        // CSV 路径（首行为表头）
    std::string labelColumn;     // 标签列名，空 = 最后一列
    bool        showRanking;     // 是否打印全部特征的熵与信息增益
};

/** 读取数据 + 计算最佳 ID3 分裂特征 */
void runFeatureRankingApp(const ProgramOptions&);

#endif // APP_FEATURE_RANKING_APP_HPP
