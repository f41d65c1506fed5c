// ------------------------------------------------------------------
// CTPN region proposal core : anchor target assignment
// ------------------------------------------------------------------

#include <set>

#include "ctpn/RPN/rpn_anchor_target.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

template <typename Dtype>
int AnchorTargets<Dtype>::count(int label) const {
  return static_cast<int>(std::count(labels.begin(), labels.end(), label));
}

INSTANTIATE_CLASS(AnchorTargets);

template <typename Dtype>
AnchorTargetAssigner<Dtype>::AnchorTargetAssigner(const RpnParam& param)
    : border_(param.allowed_border),
      positive_overlap_(param.positive_iou_threshold),
      negative_overlap_(param.negative_iou_threshold),
      clobber_positives_(param.clobber_positives),
      fg_fraction_(param.max_positive_fraction),
      batch_size_(param.batch_size),
      inside_weights_(param.bbox_inside_weights[0], param.bbox_inside_weights[1],
                      param.bbox_inside_weights[2], param.bbox_inside_weights[3]),
      positive_weight_(param.positive_weight) {
  CHECK_GE(positive_overlap_, negative_overlap_);
  CHECK_GT(batch_size_, 0);
  CHECK_LT(positive_weight_, 1) << "ilegal positive_weight";

  LOG(INFO) << "AnchorTargetAssigner : " << border_ << " allowed_border , "
            << batch_size_ << " batch_size , " << fg_fraction_ << " fg_fraction";
  LOG(INFO) << "AnchorTargetAssigner : negative_overlap : " << negative_overlap_
            << " , positive_overlap : " << positive_overlap_;
  LOG(INFO) << "AnchorTargetAssigner : bbox_inside_weights : " << inside_weights_.to_string();
}

template <typename Dtype>
void AnchorTargetAssigner<Dtype>::Subsample(vector<int>& labels, int target_label,
    int keep_count, RNG* rng) const {
  vector<int> inds;
  for (size_t index = 0; index < labels.size(); index++)
    if (labels[index] == target_label) inds.push_back(index);

  if (static_cast<int>(inds.size()) <= keep_count) return;
  CHECK(rng) << "a random source is required to subsample labels";

  const size_t n_disable = inds.size() - std::max(keep_count, 0);
  std::set<int> ind_set;
  while (ind_set.size() < n_disable) {
    int tmp_idx = rng->rand() % inds.size();
    ind_set.insert(inds[tmp_idx]);
  }
  for (std::set<int>::iterator it = ind_set.begin(); it != ind_set.end(); it++) {
    labels[*it] = -1;
  }
}

template <typename Dtype>
AnchorTargets<Dtype> AnchorTargetAssigner<Dtype>::Assign(
    const vector<Anchor<Dtype> >& all_anchors, const vector<GtBox<Dtype> >& gt_boxes,
    Dtype im_width, Dtype im_height, RNG* rng) const {
  DLOG(INFO) << "========== enter anchor target assigner {} " << im_height << ", " << im_width
             << " {} anchors : " << all_anchors.size() << " gt boxes : " << gt_boxes.size();
  CHECK_GT(im_width, 0);
  CHECK_GT(im_height, 0);

  vector<Box<Dtype> > gts(gt_boxes.begin(), gt_boxes.end());

  // only anchors inside the image are labeled
  vector<int> inds_inside;
  vector<Box<Dtype> > anchors;
  const Dtype bounds[4] = {-border_, -border_, im_width + border_, im_height + border_};
  for (size_t i = 0; i < all_anchors.size(); i++) {
    const Anchor<Dtype>& anchor = all_anchors[i];
    if (anchor[0] >= bounds[0] && anchor[1] >= bounds[1] &&
        anchor[2] < bounds[2] && anchor[3] < bounds[3]) {
      inds_inside.push_back(i);
      anchors.push_back(anchor);
    }
  }

  DLOG(INFO) << "========= total_anchors  : " << all_anchors.size();
  DLOG(INFO) << "========= inside_anchors : " << inds_inside.size();

  const int n_anchors = anchors.size();

  vector<int> labels(n_anchors, -1);

  vector<Dtype> max_overlaps(n_anchors, -1);
  vector<int> argmax_overlaps(n_anchors, -1);
  vector<Dtype> gt_max_overlaps(gts.size(), -1);
  vector<int> gt_argmax_overlaps(gts.size(), -1);

  vector<vector<Dtype> > ious = get_ious(anchors, gts);

  for (int ia = 0; ia < n_anchors; ia++) {
    for (size_t igt = 0; igt < gts.size(); igt++) {
      if (ious[ia][igt] > max_overlaps[ia]) {
        max_overlaps[ia] = ious[ia][igt];
        argmax_overlaps[ia] = igt;
      }
      if (ious[ia][igt] > gt_max_overlaps[igt]) {
        gt_max_overlaps[igt] = ious[ia][igt];
        gt_argmax_overlaps[igt] = ia;
      }
    }
  }

  if (!clobber_positives_) {
    // assign bg labels first so that positive labels can clobber them
    for (int i = 0; i < n_anchors; ++i) {
      if (max_overlaps[i] < negative_overlap_)
        labels[i] = 0;
    }
  }

  // fg label: for each gt, the anchor with highest overlap
  // a gt box no inside anchor touches forces nothing
  for (size_t j = 0; j < gt_argmax_overlaps.size(); j++) {
    if (gt_argmax_overlaps[j] >= 0 && gt_max_overlaps[j] > 0) {
      labels[gt_argmax_overlaps[j]] = 1;
    }
  }

  // fg label: above threshold IOU
  for (int i = 0; i < n_anchors; ++i) {
    if (argmax_overlaps[i] >= 0 && max_overlaps[i] >= positive_overlap_) {
      labels[i] = 1;
    }
  }

  if (clobber_positives_) {
    // assign bg labels last so that negative labels can clobber positives
    for (int i = 0; i < n_anchors; ++i) {
      if (max_overlaps[i] < negative_overlap_)
        labels[i] = 0;
    }
  }

  DLOG(INFO) << "label == 1  : " << std::count(labels.begin(), labels.end(), 1);
  DLOG(INFO) << "label == 0  : " << std::count(labels.begin(), labels.end(), 0);
  DLOG(INFO) << "label == -1 : " << std::count(labels.begin(), labels.end(), -1);
  LOG_IF(WARNING, gts.empty()) << "No gt boxes, every inside anchor is background";

  // subsample positive labels if we have too many
  const int num_fg = static_cast<int>(fg_fraction_ * batch_size_);
  Subsample(labels, 1, num_fg, rng);

  // subsample negative labels if we have too many
  const int num_bg = batch_size_ - std::count(labels.begin(), labels.end(), 1);
  Subsample(labels, 0, num_bg, rng);

  const int n_positive = std::count(labels.begin(), labels.end(), 1);
  const int n_negative = std::count(labels.begin(), labels.end(), 0);
  DLOG(INFO) << "after subsample, positive : " << n_positive << " negative : " << n_negative;

  Dtype positive_weights = 0, negative_weights = 0;
  if (positive_weight_ < 0) {
    // uniform weighting of examples (given non-uniform sampling)
    const int num_examples = n_positive + n_negative;
    if (num_examples > 0) {
      positive_weights = Dtype(1) / num_examples;
      negative_weights = Dtype(1) / num_examples;
    }
  } else {
    CHECK_GT(positive_weight_, 0) << "ilegal positive_weight";
    if (n_positive > 0) positive_weights = positive_weight_ / n_positive;
    if (n_negative > 0) negative_weights = (1 - positive_weight_) / n_negative;
  }
  DLOG(INFO) << "positive_weights : " << positive_weights;
  DLOG(INFO) << "negative_weights : " << negative_weights;

  // scatter back onto the full anchor set, outside anchors stay -1 / zero
  AnchorTargets<Dtype> targets;
  const size_t total = all_anchors.size();
  targets.labels.assign(total, -1);
  targets.bbox_targets.assign(total, Point4f<Dtype>());
  targets.bbox_inside_weights.assign(total, Point4f<Dtype>());
  targets.bbox_outside_weights.assign(total, Point4f<Dtype>());

  for (int index = 0; index < n_anchors; index++) {
    const int _anchor = inds_inside[index];
    const int label = labels[index];
    targets.labels[_anchor] = label;
    if (label == 1) {
      targets.bbox_targets[_anchor] = bbox_encode(anchors[index], gts[argmax_overlaps[index]]);
      targets.bbox_inside_weights[_anchor] = inside_weights_;
      targets.bbox_outside_weights[_anchor] = Point4f<Dtype>(
          positive_weights, positive_weights, positive_weights, positive_weights);
    } else if (label == 0) {
      targets.bbox_outside_weights[_anchor] = Point4f<Dtype>(
          negative_weights, negative_weights, negative_weights, negative_weights);
    }
  }

  return targets;
}

INSTANTIATE_CLASS(AnchorTargetAssigner);

} // namespace Rpn

} // namespace ctpn
