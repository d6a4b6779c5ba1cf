#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include "GTS.hpp"
#include "BoundaryConditions.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace GTS {

/**
 * @brief Isotropic elastic stiffness, one Lame pair per cell
 */
struct FourthOrderTensor {
    std::vector<double> mu;
    std::vector<double> lambda;

    FourthOrderTensor() = default;
    FourthOrderTensor(std::vector<double> mu_, std::vector<double> lambda_);
};

/**
 * @brief Isotropic permeability, one value per cell
 */
struct SecondOrderTensor {
    std::vector<double> kxx;

    SecondOrderTensor() = default;
    explicit SecondOrderTensor(std::vector<double> k) : kxx(std::move(k)) {}
};

/**
 * @brief Discretization parameters of one grid or interface for one keyword
 *
 * Holds scalars, arrays, boundary conditions and material tensors under
 * string keys. The reserved keys are "bc", "fourth_order_tensor" and
 * "second_order_tensor". Getters throw std::out_of_range naming the key
 * if it has not been set.
 */
class ParameterSet {
public:
    ParameterSet() = default;

    void set(const std::string& key, double value) { scalars_[key] = value; }
    void set(const std::string& key, std::vector<double> values) { arrays_[key] = std::move(values); }
    void setBoundaryCondition(BoundaryCondition bc) { bc_ = std::move(bc); }
    void setBoundaryCondition(BoundaryConditionVectorial bc) { bc_vectorial_ = std::move(bc); }
    void setStiffness(FourthOrderTensor c) { stiffness_ = std::move(c); }
    void setPermeability(SecondOrderTensor k) { permeability_ = std::move(k); }

    bool has(const std::string& key) const;
    bool empty() const;

    double scalar(const std::string& key) const;
    const std::vector<double>& array(const std::string& key) const;
    const BoundaryCondition& bc() const;
    const BoundaryConditionVectorial& bcVectorial() const;
    const FourthOrderTensor& stiffness() const;
    const SecondOrderTensor& permeability() const;

    // Keys currently set, reserved keys included
    std::vector<std::string> keys() const;

    // Overwrite this set with every entry present in other
    void update(const ParameterSet& other);

private:
    std::map<std::string, double> scalars_;
    std::map<std::string, std::vector<double>> arrays_;
    std::optional<BoundaryCondition> bc_;
    std::optional<BoundaryConditionVectorial> bc_vectorial_;
    std::optional<FourthOrderTensor> stiffness_;
    std::optional<SecondOrderTensor> permeability_;
};

using ParameterMap = std::map<std::string, ParameterSet>;

/**
 * @brief Store values under a keyword, keeping unrelated existing entries
 *
 * Calling it twice with the same values leaves the store unchanged.
 */
void initializeData(ParameterMap& store, const std::string& keyword, const ParameterSet& values);

} // namespace GTS

#endif // PARAMETERS_HPP
