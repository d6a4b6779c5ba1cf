#include "Parameters.hpp"
#include <stdexcept>

namespace GTS {

FourthOrderTensor::FourthOrderTensor(std::vector<double> mu_, std::vector<double> lambda_)
    : mu(std::move(mu_)), lambda(std::move(lambda_)) {
    if (mu.size() != lambda.size()) {
        throw std::invalid_argument("Lame parameters must have equal length");
    }
    for (size_t i = 0; i < mu.size(); ++i) {
        if (mu[i] <= 0.0) {
            throw std::invalid_argument("Shear modulus must be positive");
        }
        if (2.0 * mu[i] + 3.0 * lambda[i] <= 0.0) {
            throw std::invalid_argument("Bulk modulus must be positive");
        }
    }
}

bool ParameterSet::has(const std::string& key) const {
    if (key == "bc") return bc_.has_value() || bc_vectorial_.has_value();
    if (key == "fourth_order_tensor") return stiffness_.has_value();
    if (key == "second_order_tensor") return permeability_.has_value();
    return scalars_.count(key) > 0 || arrays_.count(key) > 0;
}

bool ParameterSet::empty() const {
    return scalars_.empty() && arrays_.empty() && !bc_ && !bc_vectorial_ &&
           !stiffness_ && !permeability_;
}

double ParameterSet::scalar(const std::string& key) const {
    auto it = scalars_.find(key);
    if (it == scalars_.end()) {
        throw std::out_of_range("Missing parameter: " + key);
    }
    return it->second;
}

const std::vector<double>& ParameterSet::array(const std::string& key) const {
    auto it = arrays_.find(key);
    if (it == arrays_.end()) {
        throw std::out_of_range("Missing parameter: " + key);
    }
    return it->second;
}

const BoundaryCondition& ParameterSet::bc() const {
    if (!bc_) throw std::out_of_range("Missing parameter: bc");
    return *bc_;
}

const BoundaryConditionVectorial& ParameterSet::bcVectorial() const {
    if (!bc_vectorial_) throw std::out_of_range("Missing parameter: bc");
    return *bc_vectorial_;
}

const FourthOrderTensor& ParameterSet::stiffness() const {
    if (!stiffness_) throw std::out_of_range("Missing parameter: fourth_order_tensor");
    return *stiffness_;
}

const SecondOrderTensor& ParameterSet::permeability() const {
    if (!permeability_) throw std::out_of_range("Missing parameter: second_order_tensor");
    return *permeability_;
}

std::vector<std::string> ParameterSet::keys() const {
    std::vector<std::string> result;
    for (const auto& kv : scalars_) result.push_back(kv.first);
    for (const auto& kv : arrays_) result.push_back(kv.first);
    if (bc_ || bc_vectorial_) result.push_back("bc");
    if (stiffness_) result.push_back("fourth_order_tensor");
    if (permeability_) result.push_back("second_order_tensor");
    return result;
}

void ParameterSet::update(const ParameterSet& other) {
    for (const auto& kv : other.scalars_) scalars_[kv.first] = kv.second;
    for (const auto& kv : other.arrays_) arrays_[kv.first] = kv.second;
    if (other.bc_) bc_ = other.bc_;
    if (other.bc_vectorial_) bc_vectorial_ = other.bc_vectorial_;
    if (other.stiffness_) stiffness_ = other.stiffness_;
    if (other.permeability_) permeability_ = other.permeability_;
}

void initializeData(ParameterMap& store, const std::string& keyword, const ParameterSet& values) {
    store[keyword].update(values);
}

} // namespace GTS
