// ------------------------------------------------------------------
// CTPN region proposal core : anchor lattice
// ------------------------------------------------------------------
#ifndef CTPN_RPN_ANCHOR_GENERATOR_HPP_
#define CTPN_RPN_ANCHOR_GENERATOR_HPP_

#include <vector>

#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"

namespace ctpn {

namespace Rpn {

/*************************************************
AnchorGenerator
Fixed-width, variable-height anchors, one set per feature map cell.
Base shape k has width base_width and height
base_width * height_ratio_step^k, centered at the origin. The shape set is
shifted to the center ((col+0.5)*stride, (row+0.5)*stride) of each cell.
Anchor index = (row * grid_width + col) * num_anchors + k, which is the
channel order the score and delta branches use.
**************************************************/
template <typename Dtype>
class AnchorGenerator {
 public:
  AnchorGenerator(Dtype base_width, Dtype height_ratio_step, int num_heights);
  explicit AnchorGenerator(const RpnParam& param);

  vector<Anchor<Dtype> > Generate(int grid_height, int grid_width, int stride) const;

  inline const vector<Box<Dtype> >& base_anchors() const { return base_anchors_; }
  inline int num_anchors() const { return static_cast<int>(base_anchors_.size()); }

 private:
  void Init(Dtype base_width, Dtype height_ratio_step, int num_heights);

  vector<Box<Dtype> > base_anchors_;
};

template <typename Dtype>
vector<Anchor<Dtype> > generate_anchors(int grid_height, int grid_width, int stride,
    Dtype base_width, Dtype height_ratio_step, int num_heights);

}  // namespace Rpn

}  // namespace ctpn

#endif  // CTPN_RPN_ANCHOR_GENERATOR_HPP_
