// ------------------------------------------------------------------
// CTPN region proposal core : configuration
// ------------------------------------------------------------------
#ifndef CTPN_RPN_PARAM_HPP_
#define CTPN_RPN_PARAM_HPP_

#include <vector>
#include <string>

namespace ctpn {

namespace Rpn {

class RpnParam {
public:
  RpnParam();

  // ======================================== Anchors
  // Every anchor shares this width; heights follow
  // base_anchor_width * height_ratio_step^k, k in [0, num_anchor_heights)
  float base_anchor_width;
  float height_ratio_step;
  int num_anchor_heights;
  int feature_stride;

  // ======================================== Train
  // Anchors may cross the image border by this many pixels and still be
  // labeled
  float allowed_border;
  float positive_iou_threshold;
  float negative_iou_threshold;
  // If an anchor statisfied by positive and negative conditions set to negative
  bool clobber_positives;
  float max_positive_fraction;
  int batch_size;
  float bbox_inside_weights[4];
  // Give the positive examples weight of p * 1 / {num positives}
  // and give negatives a weight of (1 - p)
  // Set to -1.0 to use uniform example weighting
  float positive_weight;

  int pre_nms_top_n;
  int post_nms_top_n;
  float nms_iou_threshold;
  // Proposal height and width both need to be greater than min_box_size (at
  // orig image scale)
  float min_box_size;

  float smooth_l1_sigma;

  // ======================================== Test
  // "nms" or "top"
  std::string test_mode;
  int test_pre_nms_top_n;
  int test_post_nms_top_n;
  float test_nms_iou_threshold;
  float test_min_box_size;
  int top_k_n;

  // ========================================
  int rng_seed;

  // ========================================
  void load_param(const std::string default_config_path);
  void check_param() const;
  void print_param() const;
};

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_PARAM_HPP_
