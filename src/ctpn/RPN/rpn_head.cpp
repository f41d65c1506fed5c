// ------------------------------------------------------------------
// CTPN region proposal core : region proposal head
// ------------------------------------------------------------------

#include "ctpn/RPN/rpn_head.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

template <typename Dtype>
RegionProposalHead<Dtype>::RegionProposalHead(const RpnParam& param, RpnMode mode,
    shared_ptr<FeatureExtractor<Dtype> > extractor)
    : param_(param), mode_(mode), generator_(param), extractor_(extractor) {
  param_.check_param();
  if (mode_ == TRAIN) {
    assigner_.reset(new AnchorTargetAssigner<Dtype>(param_));
    decoder_.reset(new NmsProposalDecoder<Dtype>(param_.pre_nms_top_n, param_.post_nms_top_n,
        param_.nms_iou_threshold, param_.min_box_size));
  } else if (param_.test_mode == "nms") {
    decoder_.reset(new NmsProposalDecoder<Dtype>(param_.test_pre_nms_top_n,
        param_.test_post_nms_top_n, param_.test_nms_iou_threshold, param_.test_min_box_size));
  } else if (param_.test_mode == "top") {
    decoder_.reset(new TopProposalDecoder<Dtype>(param_.top_k_n));
  } else {
    LOG(FATAL) << "Unsupported test mode : " << param_.test_mode << " (expected nms or top)";
  }
  LOG(INFO) << "RegionProposalHead : " << (mode_ == TRAIN ? "TRAIN" : "TEST") << " mode , "
            << decoder_->type() << " decoder , " << generator_.num_anchors() << " anchors per location";
}

template <typename Dtype>
RpnOutput<Dtype> RegionProposalHead<Dtype>::Forward(const FeatureMap<Dtype>& feature_map,
    const ImageInfo<Dtype>& im_info) const {
  CHECK_EQ(mode_, TEST) << "gt boxes and a random source are required in TRAIN mode";
  return Forward(feature_map, im_info, vector<GtBox<Dtype> >(), NULL);
}

template <typename Dtype>
RpnOutput<Dtype> RegionProposalHead<Dtype>::Forward(const cv::Mat& image, Dtype im_scale,
    const vector<GtBox<Dtype> >& gt_boxes, RNG* rng) const {
  CHECK(extractor_) << "RegionProposalHead was built without a FeatureExtractor";
  CHECK(!image.empty()) << "empty image";
  FeatureMap<Dtype> feature_map = extractor_->Extract(image);
  return Forward(feature_map, ImageInfo<Dtype>(image.rows, image.cols, im_scale), gt_boxes, rng);
}

template <typename Dtype>
RpnOutput<Dtype> RegionProposalHead<Dtype>::Forward(const FeatureMap<Dtype>& feature_map,
    const ImageInfo<Dtype>& im_info, const vector<GtBox<Dtype> >& gt_boxes, RNG* rng) const {
  const int A = generator_.num_anchors();
  CHECK_EQ(feature_map.num_anchors, A) << "feature map anchors do not match the configured anchor heights";
  CHECK_EQ(static_cast<int>(feature_map.cls_score.size()), feature_map.count() * 2);
  CHECK_EQ(static_cast<int>(feature_map.bbox_pred.size()), feature_map.count() * 4);
  DLOG(INFO) << "========== enter region proposal head : grid " << feature_map.height << " x "
             << feature_map.width << " , im_info " << im_info.height << ", " << im_info.width
             << ", " << im_info.scale;

  RpnOutput<Dtype> output;
  output.anchors = generator_.Generate(feature_map.height, feature_map.width, param_.feature_stride);
  const int n_anchors = output.anchors.size();

  output.cls_prob.resize(n_anchors);
  output.cls_pred.resize(n_anchors);
  for (int i = 0; i < n_anchors; i++) {
    const Dtype bg = feature_map.bg_score(i);
    const Dtype fg = feature_map.fg_score(i);
    output.cls_prob[i] = softmax_fg_prob(bg, fg);
    output.cls_pred[i] = fg > bg ? 1 : 0;
  }

  output.rois = decoder_->Decode(output.anchors, output.cls_prob, feature_map.bbox_pred, im_info);

  if (mode_ == TRAIN) {
    CHECK(rng) << "TRAIN mode needs a random source";
    output.targets = assigner_->Assign(output.anchors, gt_boxes, im_info.width, im_info.height, rng);
    output.losses = ComputeLosses(feature_map, output.targets);
    output.has_losses = true;
    DLOG(INFO) << "rpn_cross_entropy : " << output.losses.rpn_cross_entropy
               << " , rpn_loss_box : " << output.losses.rpn_loss_box;
  }
  return output;
}

template <typename Dtype>
RpnLosses<Dtype> RegionProposalHead<Dtype>::ComputeLosses(const FeatureMap<Dtype>& feature_map,
    const AnchorTargets<Dtype>& targets) const {
  CHECK_EQ(targets.size(), feature_map.count());
  // only positive and negative anchors take part
  Dtype cross_entropy = 0;
  vector<Point4f<Dtype> > preds, bbox_targets, inside_weights, outside_weights;
  for (int i = 0; i < targets.size(); i++) {
    const int label = targets.labels[i];
    if (label == -1) continue;
    cross_entropy += softmax_cross_entropy(feature_map.bg_score(i), feature_map.fg_score(i), label);
    preds.push_back(feature_map.delta(i));
    bbox_targets.push_back(targets.bbox_targets[i]);
    inside_weights.push_back(targets.bbox_inside_weights[i]);
    outside_weights.push_back(targets.bbox_outside_weights[i]);
  }

  RpnLosses<Dtype> losses;
  LOG_IF(WARNING, preds.empty()) << "No anchor selected for the rpn losses";
  if (!preds.empty()) {
    losses.rpn_cross_entropy = cross_entropy / preds.size();
    losses.rpn_loss_box = smooth_l1_loss(preds, bbox_targets, inside_weights, outside_weights,
                                         Dtype(param_.smooth_l1_sigma));
  }
  losses.total_loss = losses.rpn_cross_entropy + losses.rpn_loss_box;
  return losses;
}

INSTANTIATE_CLASS(RegionProposalHead);

} // namespace Rpn

} // namespace ctpn
