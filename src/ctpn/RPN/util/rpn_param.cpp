#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"

namespace ctpn {

namespace Rpn {

RpnParam::RpnParam()
    : base_anchor_width(16),
      height_ratio_step(1.43),
      num_anchor_heights(10),
      feature_stride(16),
      allowed_border(0),
      positive_iou_threshold(0.7),
      negative_iou_threshold(0.3),
      clobber_positives(false),
      max_positive_fraction(0.5),
      batch_size(256),
      positive_weight(-1),
      pre_nms_top_n(12000),
      post_nms_top_n(2000),
      nms_iou_threshold(0.7),
      min_box_size(8),
      smooth_l1_sigma(3.0),
      test_mode("nms"),
      test_pre_nms_top_n(6000),
      test_post_nms_top_n(300),
      test_nms_iou_threshold(0.7),
      test_min_box_size(8),
      top_k_n(5000),
      rng_seed(3) {
  std::fill(bbox_inside_weights, bbox_inside_weights + 4, 1.f);
}

void RpnParam::load_param(const std::string default_config_path) {
  std::vector<float> v_tmp;

  str_map default_map = parse_json_config(default_config_path);

  base_anchor_width = extract_float("base_anchor_width", base_anchor_width, default_map);
  height_ratio_step = extract_float("height_ratio_step", height_ratio_step, default_map);
  num_anchor_heights = extract_int("num_anchor_heights", num_anchor_heights, default_map);
  feature_stride = extract_int("feature_stride", feature_stride, default_map);

  allowed_border = extract_float("allowed_border", allowed_border, default_map);
  positive_iou_threshold = extract_float("positive_iou_threshold", positive_iou_threshold, default_map);
  negative_iou_threshold = extract_float("negative_iou_threshold", negative_iou_threshold, default_map);
  clobber_positives =
      static_cast<bool>(extract_int("clobber_positives", clobber_positives, default_map));
  max_positive_fraction = extract_float("max_positive_fraction", max_positive_fraction, default_map);
  batch_size = extract_int("batch_size", batch_size, default_map);
  v_tmp = extract_vector("bbox_inside_weights",
      std::vector<float>(bbox_inside_weights, bbox_inside_weights + 4), default_map);
  CHECK_EQ(v_tmp.size(), 4u) << "bbox_inside_weights needs 4 values";
  std::copy(v_tmp.begin(), v_tmp.end(), bbox_inside_weights);
  positive_weight = extract_float("positive_weight", positive_weight, default_map);

  pre_nms_top_n = extract_int("pre_nms_top_n", pre_nms_top_n, default_map);
  post_nms_top_n = extract_int("post_nms_top_n", post_nms_top_n, default_map);
  nms_iou_threshold = extract_float("nms_iou_threshold", nms_iou_threshold, default_map);
  min_box_size = extract_float("min_box_size", min_box_size, default_map);
  smooth_l1_sigma = extract_float("smooth_l1_sigma", smooth_l1_sigma, default_map);

  // ======================================== Test
  test_mode = extract_string("test_mode", test_mode, default_map);
  test_pre_nms_top_n = extract_int("test_pre_nms_top_n", test_pre_nms_top_n, default_map);
  test_post_nms_top_n = extract_int("test_post_nms_top_n", test_post_nms_top_n, default_map);
  test_nms_iou_threshold = extract_float("test_nms_iou_threshold", test_nms_iou_threshold, default_map);
  test_min_box_size = extract_float("test_min_box_size", test_min_box_size, default_map);
  top_k_n = extract_int("top_k_n", top_k_n, default_map);

  // ========================================
  rng_seed = extract_int("rng_seed", rng_seed, default_map);

  check_param();
}

void RpnParam::check_param() const {
  CHECK_GT(base_anchor_width, 0) << "base_anchor_width must be positive";
  CHECK_GT(height_ratio_step, 0) << "height_ratio_step must be positive";
  CHECK_GT(num_anchor_heights, 0) << "num_anchor_heights must be positive";
  CHECK_GT(feature_stride, 0) << "feature_stride must be positive";
  CHECK_GE(positive_iou_threshold, negative_iou_threshold)
      << "positive_iou_threshold below negative_iou_threshold";
  CHECK(max_positive_fraction >= 0 && max_positive_fraction <= 1)
      << "illegal max_positive_fraction : " << max_positive_fraction;
  CHECK_GT(batch_size, 0) << "batch_size must be positive";
  CHECK_LT(positive_weight, 1) << "illegal positive_weight : " << positive_weight;
  CHECK_GT(post_nms_top_n, 0) << "post_nms_top_n must be positive";
  CHECK_GT(test_post_nms_top_n, 0) << "test_post_nms_top_n must be positive";
  CHECK_GT(top_k_n, 0) << "top_k_n must be positive";
  CHECK_GT(smooth_l1_sigma, 0) << "smooth_l1_sigma must be positive";
}

void RpnParam::print_param() const {

  LOG(INFO) << "== Anchor Parameters ==";
  LOG(INFO) << "base_anchor_width      : " << base_anchor_width;
  LOG(INFO) << "height_ratio_step      : " << height_ratio_step;
  LOG(INFO) << "num_anchor_heights     : " << num_anchor_heights;
  LOG(INFO) << "feature_stride         : " << feature_stride;

  LOG(INFO) << "== Train  Parameters ==";
  LOG(INFO) << "allowed_border         : " << allowed_border;
  LOG(INFO) << "positive_iou_threshold : " << positive_iou_threshold;
  LOG(INFO) << "negative_iou_threshold : " << negative_iou_threshold;
  LOG(INFO) << "clobber_positives      : " << (clobber_positives ? "yes" : "no");
  LOG(INFO) << "max_positive_fraction  : " << max_positive_fraction;
  LOG(INFO) << "batch_size             : " << batch_size;
  LOG(INFO) << "bbox_inside_weights    : " << float_to_string(bbox_inside_weights, 4);
  LOG(INFO) << "positive_weight        : " << positive_weight;
  LOG(INFO) << "pre_nms_top_n          : " << pre_nms_top_n;
  LOG(INFO) << "post_nms_top_n         : " << post_nms_top_n;
  LOG(INFO) << "nms_iou_threshold      : " << nms_iou_threshold;
  LOG(INFO) << "min_box_size           : " << min_box_size;
  LOG(INFO) << "smooth_l1_sigma        : " << smooth_l1_sigma;

  LOG(INFO) << "== Test   Parameters ==";
  LOG(INFO) << "test_mode              : " << test_mode;
  LOG(INFO) << "test_pre_nms_top_n     : " << test_pre_nms_top_n;
  LOG(INFO) << "test_post_nms_top_n    : " << test_post_nms_top_n;
  LOG(INFO) << "test_nms_iou_threshold : " << test_nms_iou_threshold;
  LOG(INFO) << "test_min_box_size      : " << test_min_box_size;
  LOG(INFO) << "top_k_n                : " << top_k_n;

  LOG(INFO) << "== Global Parameters ==";
  LOG(INFO) << "rng_seed               : " << rng_seed;
}

} // namespace Rpn

} // namespace ctpn
