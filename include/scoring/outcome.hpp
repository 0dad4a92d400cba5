#pragma once

namespace scoring {

/**
 * @brief 表示单个测试点对选手公开的粗粒度评测结果
 * 由 reduction_policy::classify 根据测试点的 outcome 得出，
 * 真正显示给选手的文字是 get_message_key 返回的消息经过翻译后的结果。
 */
enum class outcome_label {
    /**
     * @brief 测试点没有得分，outcome <= 0
     */
    NOT_CORRECT = 0,

    /**
     * @brief 测试点得到部分分
     */
    PARTIALLY_CORRECT = 1,

    /**
     * @brief 测试点得到满分，outcome >= 1
     */
    CORRECT = 2
};

/**
 * @brief 获取评测结果对应的可翻译消息
 * 返回值是翻译目录中的 msgid，而不是最终显示的文字
 */
const char *get_message_key(outcome_label);

}  // namespace scoring
